#include "frame_stager.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::pipeline {

namespace {

std::string LowerExtension(const std::string& source_path) {
  auto base = storage::common::BaseName(source_path);
  auto dot  = base.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return {};

  std::string ext = base.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext;
}

} // namespace

std::size_t FrameNameWidth(std::size_t frame_count) {
  std::size_t width = 1;
  for (std::size_t last = frame_count > 0 ? frame_count - 1 : 0; last >= 10; last /= 10) {
    ++width;
  }
  return std::max<std::size_t>(4, width);
}

std::string FrameName(std::size_t index, std::size_t width, const std::string& source_path) {
  std::string digits = std::to_string(index);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return "frame_" + digits + LowerExtension(source_path);
}

FrameStager::FrameStager(std::shared_ptr<storage::ArtifactStore> store) : store_(std::move(store)) {
}

std::vector<std::string> FrameStager::Stage(const std::vector<std::string>& sources, const std::string& staging_dir) {
  try {
    store_->CreateDir(staging_dir);
  } catch (const std::exception& e) {
    throw util::StagingFailed("cannot create staging area " + staging_dir + ": " + e.what(), staging_dir);
  }

  const auto width = FrameNameWidth(sources.size());

  std::vector<std::string> staged;
  staged.reserve(sources.size());
  for (std::size_t i = 0; i < sources.size(); ++i) {
    const auto& source = sources[i];
    auto        target = storage::common::JoinStorePath(staging_dir, FrameName(i, width, source));
    try {
      store_->Copy(source, target);
    } catch (const std::exception& e) {
      throw util::StagingFailed("failed to stage " + source + ": " + e.what(), source);
    }
    staged.push_back(std::move(target));
  }

  SLIDESHOW_LOG_DEBUG("frames staged", {observability::StringField("staging_dir", staging_dir),
                                        observability::IntField("frames", static_cast<int64_t>(staged.size()))});
  return staged;
}

} // namespace slideshow::pipeline
