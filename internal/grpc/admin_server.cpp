#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace slideshow::grpc {

AdminServer::AdminServer(std::shared_ptr<slideshow::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Healthcheck(::grpc::ServerContext*, const slideshow::v1::HealthcheckRequest* req,
                                        slideshow::v1::HealthcheckResponse* resp) {
  try {
    *resp = service_->Healthcheck(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const slideshow::v1::StatsRequest* req, slideshow::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace slideshow::grpc
