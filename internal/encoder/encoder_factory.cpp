#include "encoder_factory.hpp"

#include "internal/encoder/ffmpeg_encoder.hpp"
#include "internal/encoder/placeholder_encoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/subprocess.hpp"

namespace slideshow::encoder {

std::shared_ptr<Encoder> MakeEncoder(std::shared_ptr<storage::ArtifactStore> store, EncodeOptions options,
                                     bool allow_placeholder) {
  if (auto resolved = process::FindExecutable(options.binary)) {
    SLIDESHOW_LOG_INFO("encoder selected", {observability::StringField("mode", "ffmpeg"),
                                            observability::StringField("binary", *resolved)});
    options.binary = *resolved;
    return std::make_shared<FfmpegEncoder>(std::move(store), std::move(options));
  }

  if (allow_placeholder) {
    SLIDESHOW_LOG_WARN("encoder binary not found, generated videos will be placeholders",
                       {observability::StringField("binary", options.binary),
                        observability::BoolField("placeholder", true)});
    return std::make_shared<PlaceholderEncoder>(std::move(store), std::move(options));
  }

  SLIDESHOW_LOG_ERROR("encoder binary not found and placeholder output is disabled",
                      {observability::StringField("binary", options.binary)});
  return std::make_shared<FfmpegEncoder>(std::move(store), std::move(options));
}

} // namespace slideshow::encoder
