#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/storage/artifact_store.hpp"

namespace slideshow::pipeline {

/*
  Copies ordered source images into a staging area as

      frame_0000.<ext>, frame_0001.<ext>, ...

  so that lexical order of the staged names equals playback order. The
  counter is at least 4 digits and widens when the input needs more.
  The source extension is kept (lower-cased) so the encoder can probe it.
*/
class FrameStager {
 public:
  explicit FrameStager(std::shared_ptr<storage::ArtifactStore> store);

  // Returns staged store paths in input order. Throws util::StagingFailed
  // naming the first source that could not be copied.
  std::vector<std::string> Stage(const std::vector<std::string>& sources, const std::string& staging_dir);

 private:
  std::shared_ptr<storage::ArtifactStore> store_;
};

std::size_t FrameNameWidth(std::size_t frame_count);

std::string FrameName(std::size_t index, std::size_t width, const std::string& source_path);

} // namespace slideshow::pipeline
