#pragma once

#include <memory>

#include "internal/encoder/encode_plan.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/storage/artifact_store.hpp"

namespace slideshow::encoder {

/*
  Pick the encoder strategy once, at startup.

    binary resolves             → FfmpegEncoder
    missing + allow_placeholder → PlaceholderEncoder (WARN)
    missing                     → FfmpegEncoder; every attempt fails EncodeFailed
*/
std::shared_ptr<Encoder> MakeEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options,
                                     bool allow_placeholder);

} // namespace slideshow::encoder
