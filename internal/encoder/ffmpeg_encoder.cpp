#include "ffmpeg_encoder.hpp"

#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::encoder {

namespace {

std::string LastLine(const std::string& text) {
  auto end = text.find_last_not_of("\r\n");
  if (end == std::string::npos) return {};
  auto begin = text.find_last_of('\n', end);
  begin      = begin == std::string::npos ? 0 : begin + 1;
  return text.substr(begin, end - begin + 1);
}

} // namespace

FfmpegEncoder::FfmpegEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
}

EncodeResult FfmpegEncoder::Encode(const EncodeRequest& request) {
  std::vector<std::string> inputs;
  EncodePlan               plan;
  try {
    inputs.reserve(request.frame_paths.size());
    for (const auto& frame : request.frame_paths) {
      inputs.push_back(store_->LocalPath(frame));
    }

    auto parent = storage::common::ParentOf(request.output_path);
    if (!parent.empty()) {
      store_->CreateDir(parent);
    }

    plan = BuildEncodePlan(inputs, store_->LocalPath(request.output_path), request.seconds_per_frame, request.fps,
                           options_);
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_ERROR("encoder setup failed", {observability::StringField("output", request.output_path),
                                                 observability::StringField("error", e.what())});
    throw util::EncodeFailed(std::string("encoder setup failed: ") + e.what(), -1, e.what());
  }

  SLIDESHOW_LOG_INFO("encoder invocation", {observability::StringField("binary", options_.binary),
                                            observability::IntField("args", static_cast<int64_t>(plan.argv.size())),
                                            observability::IntField("frames", static_cast<int64_t>(inputs.size())),
                                            observability::StringField("output", request.output_path)});

  process::ProcessResult run;
  try {
    run = process::RunProcess(plan.argv, options_.timeout);
  } catch (const process::SpawnError& e) {
    SLIDESHOW_LOG_ERROR("encoder spawn failed", {observability::StringField("binary", options_.binary),
                                                 observability::StringField("error", e.what())});
    throw util::EncodeFailed(std::string("encoder could not be started: ") + e.what(), -1, e.what());
  }

  if (run.timed_out || run.exit_code != 0) {
    DiscardOutput(request.output_path);

    SLIDESHOW_LOG_ERROR("encoder failed", {observability::IntField("exit_code", run.exit_code),
                                           observability::BoolField("timed_out", run.timed_out),
                                           observability::StringField("diagnostics", LastLine(run.diagnostics))});

    std::string message = run.timed_out
                              ? "encoder timed out after " + std::to_string(options_.timeout.count()) + "ms"
                              : "encoder exited with status " + std::to_string(run.exit_code);
    throw util::EncodeFailed(message, run.exit_code, std::move(run.diagnostics), run.timed_out);
  }

  if (!store_->Exists(request.output_path)) {
    throw util::EncodeFailed("encoder exited cleanly but produced no output", 0, std::move(run.diagnostics));
  }

  EncodeResult result;
  result.duration_seconds = plan.expected_duration_seconds;
  result.diagnostics      = std::move(run.diagnostics);
  return result;
}

void FfmpegEncoder::DiscardOutput(const std::string& output_path) {
  try {
    store_->Remove(output_path, /*recursive=*/false);
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_WARN("partial output cleanup failed", {observability::StringField("path", output_path),
                                                         observability::StringField("error", e.what())});
  }
}

} // namespace slideshow::encoder
