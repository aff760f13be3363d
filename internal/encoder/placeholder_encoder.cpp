#include "placeholder_encoder.hpp"

#include <arrow/buffer.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::encoder {

PlaceholderEncoder::PlaceholderEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
}

const std::string& PlaceholderEncoder::PlaceholderBytes() {
  // ftyp: size 24, brand isom, minor 0x200, compatible isom mp41
  // free: size 8
  static const std::string bytes = std::string("\x00\x00\x00\x18", 4) + "ftyp" + "isom" +
                                   std::string("\x00\x00\x02\x00", 4) + "isom" + "mp41" +
                                   std::string("\x00\x00\x00\x08", 4) + "free";
  return bytes;
}

EncodeResult PlaceholderEncoder::Encode(const EncodeRequest& request) {
  // same parameter checks as a real encode
  auto plan = BuildEncodePlan(request.frame_paths, request.output_path, request.seconds_per_frame, request.fps,
                              options_);

  try {
    store_->Write(request.output_path, arrow::Buffer::FromString(PlaceholderBytes()));
  } catch (const std::exception& e) {
    throw util::EncodeFailed(std::string("placeholder output could not be written: ") + e.what(), -1, e.what());
  }

  SLIDESHOW_LOG_WARN("encoder unavailable, wrote placeholder output",
                     {observability::BoolField("placeholder", true),
                      observability::StringField("output", request.output_path),
                      observability::IntField("frames", static_cast<int64_t>(request.frame_paths.size()))});

  EncodeResult result;
  result.placeholder      = true;
  result.duration_seconds = plan.expected_duration_seconds;
  return result;
}

} // namespace slideshow::encoder
