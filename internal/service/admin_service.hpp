#pragma once

#include "service_context.hpp"
#include "slideshow/v1/admin_service.pb.h"

namespace slideshow::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  slideshow::v1::HealthcheckResponse
  Healthcheck(const slideshow::v1::HealthcheckRequest& req);

  slideshow::v1::StatsResponse
  Stats(const slideshow::v1::StatsRequest& req);

private:
  ServiceContext ctx_;
};

}
