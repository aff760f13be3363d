#include "project_server.hpp"

#include "grpc_error.hpp"

namespace slideshow::grpc {

ProjectServer::ProjectServer(std::shared_ptr<slideshow::service::ProjectService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ProjectServer::CreateProject(::grpc::ServerContext*,
                                            const slideshow::v1::CreateProjectRequest* req,
                                            slideshow::v1::CreateProjectResponse* resp) {
  try {
    *resp = service_->CreateProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ListProjects(::grpc::ServerContext*,
                                           const slideshow::v1::ListProjectsRequest* req,
                                           slideshow::v1::ListProjectsResponse* resp) {
  try {
    *resp = service_->ListProjects(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::GetProject(::grpc::ServerContext*,
                                         const slideshow::v1::GetProjectRequest* req,
                                         slideshow::v1::GetProjectResponse* resp) {
  try {
    *resp = service_->GetProject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::UploadImage(::grpc::ServerContext*,
                                          const slideshow::v1::UploadImageRequest* req,
                                          slideshow::v1::UploadImageResponse* resp) {
  try {
    *resp = service_->UploadImage(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::ListProjectImages(::grpc::ServerContext*,
                                                const slideshow::v1::ListProjectImagesRequest* req,
                                                slideshow::v1::ListProjectImagesResponse* resp) {
  try {
    *resp = service_->ListProjectImages(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ProjectServer::UpdateProjectStatus(::grpc::ServerContext*,
                                                  const slideshow::v1::UpdateProjectStatusRequest* req,
                                                  slideshow::v1::UpdateProjectStatusResponse* resp) {
  try {
    *resp = service_->UpdateProjectStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
