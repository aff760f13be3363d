#pragma once

#include "service_context.hpp"
#include "slideshow/v1/project_service.pb.h"

namespace slideshow::service {

/*
  Project and image bookkeeping.

  Projects are created pending with no output. Images are written to the
  artifact store under images/project_<id>/ and recorded in the ledger.
*/
class ProjectService {
public:
  explicit ProjectService(ServiceContext ctx);

  slideshow::v1::CreateProjectResponse CreateProject(const slideshow::v1::CreateProjectRequest& req);
  slideshow::v1::ListProjectsResponse ListProjects(const slideshow::v1::ListProjectsRequest& req);
  slideshow::v1::GetProjectResponse GetProject(const slideshow::v1::GetProjectRequest& req);
  slideshow::v1::UploadImageResponse UploadImage(const slideshow::v1::UploadImageRequest& req);
  slideshow::v1::ListProjectImagesResponse ListProjectImages(const slideshow::v1::ListProjectImagesRequest& req);
  slideshow::v1::UpdateProjectStatusResponse UpdateProjectStatus(const slideshow::v1::UpdateProjectStatusRequest& req);

private:
  ServiceContext ctx_;
};

// Last path component with separators and control characters removed.
std::string SanitizeFilename(const std::string& filename);

}
