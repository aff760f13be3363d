#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "slideshow/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace slideshow::grpc {

class AdminServer final : public slideshow::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<slideshow::service::AdminService> svc);

  ::grpc::Status Healthcheck(::grpc::ServerContext*,
                             const slideshow::v1::HealthcheckRequest*,
                             slideshow::v1::HealthcheckResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const slideshow::v1::StatsRequest*,
                       slideshow::v1::StatsResponse*) override;

private:
  std::shared_ptr<slideshow::service::AdminService> service_;
};

}
