#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "slideshow/v1/project_service.grpc.pb.h"
#include "internal/service/project_service.hpp"

namespace slideshow::grpc {

class ProjectServer final : public slideshow::v1::ProjectService::Service {
public:
  explicit ProjectServer(std::shared_ptr<slideshow::service::ProjectService> svc);

  ::grpc::Status CreateProject(::grpc::ServerContext*,
                               const slideshow::v1::CreateProjectRequest*,
                               slideshow::v1::CreateProjectResponse*) override;

  ::grpc::Status ListProjects(::grpc::ServerContext*,
                              const slideshow::v1::ListProjectsRequest*,
                              slideshow::v1::ListProjectsResponse*) override;

  ::grpc::Status GetProject(::grpc::ServerContext*,
                            const slideshow::v1::GetProjectRequest*,
                            slideshow::v1::GetProjectResponse*) override;

  ::grpc::Status UploadImage(::grpc::ServerContext*,
                             const slideshow::v1::UploadImageRequest*,
                             slideshow::v1::UploadImageResponse*) override;

  ::grpc::Status ListProjectImages(::grpc::ServerContext*,
                                   const slideshow::v1::ListProjectImagesRequest*,
                                   slideshow::v1::ListProjectImagesResponse*) override;

  ::grpc::Status UpdateProjectStatus(::grpc::ServerContext*,
                                     const slideshow::v1::UpdateProjectStatusRequest*,
                                     slideshow::v1::UpdateProjectStatusResponse*) override;

private:
  std::shared_ptr<slideshow::service::ProjectService> service_;
};

}
