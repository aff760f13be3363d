#pragma once

#include <memory>

#include "internal/encoder/encode_plan.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/storage/artifact_store.hpp"

namespace slideshow::encoder {

/*
  Availability fallback used when the encoder binary is not installed.

  Writes a minimal MP4 container (ftyp + free boxes, no tracks) so status
  and path bookkeeping stay exercisable. Every use is logged at WARN and
  the result is flagged placeholder = true.
*/
class PlaceholderEncoder final : public Encoder {
 public:
  PlaceholderEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options);

  EncodeResult Encode(const EncodeRequest& request) override;

  std::string Mode() const override {
    return "placeholder";
  }

  // The exact bytes written for every placeholder output.
  static const std::string& PlaceholderBytes();

 private:
  std::shared_ptr<storage::ArtifactStore> store_;
  EncodeOptions                           options_;
};

} // namespace slideshow::encoder
