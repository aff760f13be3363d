#pragma once

#include <cstddef>
#include <functional>

#include "service_context.hpp"
#include "slideshow/v1/generation_service.pb.h"

namespace slideshow::service {

/*
  Front door to the generation pipeline.

  Admits one attempt per project at a time; a second request for a
  project whose attempt is still running or queued fails InvalidState.
*/
class GenerationService {
public:
  // Receives each chunk in order; returning false stops the transfer.
  using ChunkSink = std::function<bool(const slideshow::v1::VideoChunk&)>;

  static constexpr std::size_t kDownloadChunkBytes = 64 * 1024;

  explicit GenerationService(ServiceContext ctx);

  slideshow::v1::GenerateVideoResponse GenerateVideo(const slideshow::v1::GenerateVideoRequest& req);

  slideshow::v1::GetVideoDownloadResponse GetVideoDownload(const slideshow::v1::GetVideoDownloadRequest& req);

  void DownloadVideo(const slideshow::v1::DownloadVideoRequest& req, const ChunkSink& sink);

private:
  ServiceContext ctx_;
};

}
