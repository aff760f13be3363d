#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/pipeline/frame_stager.hpp"
#include "internal/storage/artifact_store.hpp"

namespace slideshow::core {

struct OrchestratorOptions {
  // store-relative roots
  std::string videos_dir  = "videos";
  std::string staging_dir = "staging";
};

struct GenerationOutcome {
  db::model::ProjectRecord project;
  bool                     placeholder = false;
};

/*
  Runs one generation attempt for a project end to end.

  Order of effects:
    1. status → processing (before any file I/O)
    2. load project, ordered images; verify every image file exists
    3. stage frames into a fresh staging area
    4. encode into a fresh output path
    5. remove the staging area
    6. status → completed + output_path  |  failed (output_path untouched)

  Exactly one terminal status is written per attempt and only after all
  file I/O for the attempt is done. The original error is rethrown after
  the failed status is recorded; cleanup problems are logged only.

  Attempts for different projects may run concurrently. Callers must not
  run two attempts for the same project at once.
*/
class GenerationOrchestrator {
 public:
  GenerationOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<storage::ArtifactStore> store,
                         std::shared_ptr<encoder::Encoder> encoder, OrchestratorOptions options = {});

  GenerationOutcome Generate(int64_t project_id);

 private:
  void MarkProcessing(int64_t project_id);
  void MarkFailed(int64_t project_id);
  db::model::ProjectRecord MarkCompleted(int64_t project_id, const std::string& output_path);
  void RemoveStagingArea(const std::string& staging_path);

  std::string NewOutputPath(int64_t project_id) const;
  std::string NewStagingPath(int64_t project_id) const;

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<storage::ArtifactStore> store_;
  std::shared_ptr<encoder::Encoder>       encoder_;
  pipeline::FrameStager                   stager_;
  OrchestratorOptions                     options_;
};

} // namespace slideshow::core
