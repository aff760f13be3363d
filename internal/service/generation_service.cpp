#include "generation_service.hpp"

#include "internal/core/generation_orchestrator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/generation/generation_scheduler.hpp"
#include "internal/generation/single_flight.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/project_mapping.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::service {

using namespace slideshow::v1;

namespace {

void RequireProjectId(int64_t project_id) {
  if (project_id <= 0) {
    throw util::InvalidArgument("project_id must be positive");
  }
}

db::model::ProjectRecord LoadProject(db::Repository& repository, int64_t project_id) {
  auto tx     = repository.Begin();
  auto record = repository.GetProject(*tx, project_id);
  tx->Commit();
  if (!record.has_value()) {
    throw util::NotFound("project " + std::to_string(project_id) + " not found");
  }
  return *record;
}

// Store path of the project's current video; throws if there is none.
std::string RequireOutput(const db::model::ProjectRecord& project, storage::ArtifactStore& store) {
  if (!project.output_path.has_value() || project.output_path->empty()) {
    throw util::InvalidState("project " + std::to_string(project.id) + " has no generated video");
  }
  if (!store.Exists(*project.output_path)) {
    throw util::NotFound("video file not found: " + *project.output_path);
  }
  return *project.output_path;
}

} // namespace

GenerationService::GenerationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GenerateVideoResponse GenerationService::GenerateVideo(const GenerateVideoRequest& req) {
  return ObserveRpc("GenerationService.GenerateVideo", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    auto lease = ctx_.single_flight->TryAcquire(req.project_id());
    if (!lease.has_value()) {
      throw util::InvalidState("generation already in progress for project " + std::to_string(req.project_id()));
    }

    GenerateVideoResponse resp;
    if (req.wait()) {
      auto outcome = ctx_.orchestrator->Generate(req.project_id());
      *resp.mutable_project() = ToProto(outcome.project);
      resp.set_placeholder(outcome.placeholder);
      return resp;
    }

    // reject unknown ids up front rather than failing in the background
    auto project = LoadProject(*ctx_.repository, req.project_id());

    generation::GenerationTask task;
    task.project_id = req.project_id();
    task.lease      = std::move(*lease);
    if (!ctx_.scheduler->Enqueue(std::move(task))) {
      throw util::InvalidState("generation workers are shutting down");
    }

    *resp.mutable_project() = ToProto(project);
    resp.set_queued(true);
    resp.set_placeholder(ctx_.encoder->Mode() == "placeholder");
    return resp;
  });
}

GetVideoDownloadResponse GenerationService::GetVideoDownload(const GetVideoDownloadRequest& req) {
  return ObserveRpc("GenerationService.GetVideoDownload", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    auto project     = LoadProject(*ctx_.repository, req.project_id());
    auto output_path = RequireOutput(project, *ctx_.store);
    auto filename    = storage::common::BaseName(output_path);

    GetVideoDownloadResponse resp;
    resp.set_download_url("/videos/" + filename);
    resp.set_filename(filename);
    resp.set_output_path(output_path);
    resp.set_size_bytes(ctx_.store->Size(output_path));
    return resp;
  });
}

void GenerationService::DownloadVideo(const DownloadVideoRequest& req, const ChunkSink& sink) {
  ObserveRpc("GenerationService.DownloadVideo", req.project_id(), [&] {
    RequireProjectId(req.project_id());

    auto project     = LoadProject(*ctx_.repository, req.project_id());
    auto output_path = RequireOutput(project, *ctx_.store);

    uint64_t offset = 0;
    for (;;) {
      auto buffer = ctx_.store->ReadRange(output_path, offset, kDownloadChunkBytes);
      if (buffer->size() == 0) break;

      VideoChunk chunk;
      chunk.set_offset(offset);
      chunk.set_data(buffer->data(), static_cast<std::size_t>(buffer->size()));
      if (!sink(chunk)) break;

      offset += static_cast<uint64_t>(buffer->size());
    }
  });
}

} // namespace slideshow::service
