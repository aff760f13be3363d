#include "generation_server.hpp"

#include "grpc_error.hpp"

namespace slideshow::grpc {

GenerationServer::GenerationServer(std::shared_ptr<slideshow::service::GenerationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status GenerationServer::GenerateVideo(::grpc::ServerContext*,
                                               const slideshow::v1::GenerateVideoRequest* req,
                                               slideshow::v1::GenerateVideoResponse* resp) {
  try {
    *resp = service_->GenerateVideo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::GetVideoDownload(::grpc::ServerContext*,
                                                  const slideshow::v1::GetVideoDownloadRequest* req,
                                                  slideshow::v1::GetVideoDownloadResponse* resp) {
  try {
    *resp = service_->GetVideoDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status GenerationServer::DownloadVideo(::grpc::ServerContext* ctx,
                                               const slideshow::v1::DownloadVideoRequest* req,
                                               ::grpc::ServerWriter<slideshow::v1::VideoChunk>* writer) {
  try {
    bool cancelled = false;
    service_->DownloadVideo(*req, [&](const slideshow::v1::VideoChunk& chunk) {
      if (ctx->IsCancelled() || !writer->Write(chunk)) {
        cancelled = true;
        return false;
      }
      return true;
    });
    if (cancelled) {
      return {::grpc::StatusCode::CANCELLED, "download cancelled by client"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
