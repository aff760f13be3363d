#include "generation_orchestrator.hpp"

#include <chrono>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "slideshow/v1/types.pb.h"

namespace slideshow::core {

using slideshow::observability::IntField;
using slideshow::observability::ProjectField;
using slideshow::observability::StringField;

namespace {

std::string OutcomeLabel(const std::exception& e) {
  if (dynamic_cast<const util::NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const util::EmptyInput*>(&e)) return "empty_input";
  if (dynamic_cast<const util::MissingAsset*>(&e)) return "missing_asset";
  if (dynamic_cast<const util::StagingFailed*>(&e)) return "staging_failed";
  if (dynamic_cast<const util::EncodeFailed*>(&e)) return "encode_failed";
  return "error";
}

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

GenerationOrchestrator::GenerationOrchestrator(std::shared_ptr<db::Repository> repository,
                                               std::shared_ptr<storage::ArtifactStore> store,
                                               std::shared_ptr<encoder::Encoder> encoder, OrchestratorOptions options)
    : repository_(std::move(repository)),
      store_(store),
      encoder_(std::move(encoder)),
      stager_(std::move(store)),
      options_(std::move(options)) {
}

GenerationOutcome GenerationOrchestrator::Generate(int64_t project_id) {
  observability::Span span("generation.attempt");
  span.SetProject(project_id);

  const auto  started = std::chrono::steady_clock::now();
  std::string staging_path;

  try {
    MarkProcessing(project_id);

    db::model::ProjectRecord             project;
    std::vector<db::model::ImageRecord>  images;
    {
      auto tx     = repository_->Begin();
      auto record = repository_->GetProject(*tx, project_id);
      if (!record.has_value()) {
        throw util::NotFound("project " + std::to_string(project_id) + " not found");
      }
      project = std::move(*record);
      images  = repository_->ListImagesOrdered(*tx, project_id);
      tx->Commit();
    }

    if (images.empty()) {
      throw util::EmptyInput("no images found for project " + std::to_string(project_id));
    }

    std::vector<std::string> sources;
    sources.reserve(images.size());
    for (const auto& image : images) {
      bool present = false;
      try {
        present = store_->Exists(image.file_path);
      } catch (const util::InvalidArgument&) {
        present = false;
      }
      if (!present) {
        throw util::MissingAsset("image file not found: " + image.file_path, image.file_path);
      }
      sources.push_back(image.file_path);
    }

    SLIDESHOW_LOG_INFO("generation started",
                       {ProjectField(project_id), IntField("frames", static_cast<int64_t>(sources.size()))});

    const auto output_path = NewOutputPath(project_id);
    staging_path           = NewStagingPath(project_id);

    auto frames = stager_.Stage(sources, staging_path);
    observability::Metrics::Instance().AddFramesStaged(frames.size());
    span.AddEvent("frames_staged");

    encoder::EncodeRequest request;
    request.frame_paths       = std::move(frames);
    request.output_path       = output_path;
    request.seconds_per_frame = project.duration_per_image;
    request.fps               = project.fps;

    auto encoded = encoder_->Encode(request);
    span.AddEvent("encoded");

    RemoveStagingArea(staging_path);
    staging_path.clear();

    GenerationOutcome outcome;
    outcome.project     = MarkCompleted(project_id, output_path);
    outcome.placeholder = encoded.placeholder;

    observability::Metrics::Instance().RecordGeneration("completed", ElapsedMs(started), encoded.placeholder);
    SLIDESHOW_LOG_INFO("generation completed", {ProjectField(project_id), StringField("output", output_path),
                                                observability::DoubleField("duration_s", encoded.duration_seconds),
                                                observability::BoolField("placeholder", encoded.placeholder)});
    return outcome;
  } catch (const std::exception& e) {
    if (!staging_path.empty()) {
      RemoveStagingArea(staging_path);
    }
    MarkFailed(project_id);

    const auto outcome = OutcomeLabel(e);
    observability::Metrics::Instance().RecordGeneration(outcome, ElapsedMs(started), false);
    span.RecordError(outcome, e.what());
    SLIDESHOW_LOG_ERROR("generation failed", {ProjectField(project_id), StringField("kind", outcome),
                                              StringField("error", e.what())});
    throw;
  }
}

void GenerationOrchestrator::MarkProcessing(int64_t project_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->SetProjectStatus(*tx, project_id, slideshow::v1::PROJECT_STATUS_PROCESSING, std::nullopt,
                                              util::NowMillis());
  // an absent project is reported by the load that follows
  if (!result && result.code == db::ErrorCode::NotFound) {
    return;
  }
  db::ThrowIfDbError(result, "mark processing");
  tx->Commit();
}

void GenerationOrchestrator::MarkFailed(int64_t project_id) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->SetProjectStatus(*tx, project_id, slideshow::v1::PROJECT_STATUS_FAILED, std::nullopt,
                                                util::NowMillis());
    if (!result) {
      SLIDESHOW_LOG_WARN("could not record failed status",
                         {ProjectField(project_id), StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_WARN("could not record failed status",
                       {ProjectField(project_id), StringField("error", e.what())});
  }
}

db::model::ProjectRecord GenerationOrchestrator::MarkCompleted(int64_t project_id, const std::string& output_path) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->SetProjectStatus(*tx, project_id, slideshow::v1::PROJECT_STATUS_COMPLETED,
                                                   output_path, util::NowMillis()),
                     "mark completed");
  auto record = repository_->GetProject(*tx, project_id);
  if (!record.has_value()) {
    throw util::NotFound("project " + std::to_string(project_id) + " not found");
  }
  tx->Commit();
  return *record;
}

void GenerationOrchestrator::RemoveStagingArea(const std::string& staging_path) {
  try {
    store_->Remove(staging_path, /*recursive=*/true);
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_WARN("staging cleanup failed", {StringField("staging_dir", staging_path),
                                                  StringField("error", e.what())});
  }
}

std::string GenerationOrchestrator::NewOutputPath(int64_t project_id) const {
  return storage::common::JoinStorePath(options_.videos_dir, "project_" + std::to_string(project_id) + "_" +
                                                                 std::to_string(util::NowMillis()) + "_" +
                                                                 util::ShortToken() + ".mp4");
}

std::string GenerationOrchestrator::NewStagingPath(int64_t project_id) const {
  return storage::common::JoinStorePath(options_.staging_dir, "project_" + std::to_string(project_id) + "_" +
                                                                  util::ToString(util::GenerateUUID()));
}

} // namespace slideshow::core
