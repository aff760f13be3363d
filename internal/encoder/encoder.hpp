#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace slideshow::encoder {

/*
  Turns an ordered list of staged frames into one video artifact.

  Paths are store-relative. Implementations throw util::EncodeFailed on
  any failure; a returned result always means the output exists.
*/

struct EncodeRequest {
  std::vector<std::string> frame_paths;
  std::string              output_path;
  double                   seconds_per_frame = 0.0;
  int32_t                  fps               = 0;
};

struct EncodeResult {
  // true when no real encode happened (availability fallback)
  bool        placeholder      = false;
  double      duration_seconds = 0.0;
  std::string diagnostics;
};

class Encoder {
 public:
  virtual ~Encoder() = default;

  virtual EncodeResult Encode(const EncodeRequest& request) = 0;

  // "ffmpeg" or "placeholder"
  virtual std::string Mode() const = 0;
};

} // namespace slideshow::encoder
