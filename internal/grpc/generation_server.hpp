#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "slideshow/v1/generation_service.grpc.pb.h"
#include "internal/service/generation_service.hpp"

namespace slideshow::grpc {

class GenerationServer final : public slideshow::v1::GenerationService::Service {
public:
  explicit GenerationServer(std::shared_ptr<slideshow::service::GenerationService> svc);

  ::grpc::Status GenerateVideo(::grpc::ServerContext*,
                               const slideshow::v1::GenerateVideoRequest*,
                               slideshow::v1::GenerateVideoResponse*) override;

  ::grpc::Status GetVideoDownload(::grpc::ServerContext*,
                                  const slideshow::v1::GetVideoDownloadRequest*,
                                  slideshow::v1::GetVideoDownloadResponse*) override;

  ::grpc::Status DownloadVideo(::grpc::ServerContext*,
                               const slideshow::v1::DownloadVideoRequest*,
                               ::grpc::ServerWriter<slideshow::v1::VideoChunk>*) override;

private:
  std::shared_ptr<slideshow::service::GenerationService> service_;
};

}
