#pragma once

#include <memory>

#include "internal/encoder/encode_plan.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/storage/artifact_store.hpp"

namespace slideshow::encoder {

/*
  Runs the external encoder as a child process.

  Exit status zero is the only success signal. Non-zero exit, a timeout or
  a binary that cannot be spawned all raise util::EncodeFailed carrying the
  exit code and the diagnostic tail. A partial output is removed.
*/
class FfmpegEncoder final : public Encoder {
 public:
  FfmpegEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options);

  EncodeResult Encode(const EncodeRequest& request) override;

  std::string Mode() const override {
    return "ffmpeg";
  }

 private:
  void DiscardOutput(const std::string& output_path);

  std::shared_ptr<storage::ArtifactStore> store_;
  EncodeOptions                           options_;
};

} // namespace slideshow::encoder
