#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace slideshow::encoder {

struct EncodeOptions {
  std::string binary        = "ffmpeg";
  int32_t     output_width  = 1920;
  int32_t     output_height = 1080;
  std::string video_codec   = "libx264";
  std::string pixel_format  = "yuv420p";

  std::chrono::milliseconds timeout{600000};
};

struct EncodePlan {
  std::vector<std::string> argv;
  // frames × seconds_per_frame
  double expected_duration_seconds = 0.0;
};

/*
  Build the ffmpeg command line for a slideshow.

  Every frame is looped for seconds_per_frame, scaled into the canonical
  canvas keeping its aspect ratio, padded to fill it, then all frames are
  concatenated in input order at fps.

  frame_paths and output_path are filesystem paths as the process sees them.
  Throws util::InvalidArgument on empty input or out-of-range parameters.
*/
EncodePlan BuildEncodePlan(const std::vector<std::string>& frame_paths, const std::string& output_path,
                           double seconds_per_frame, int32_t fps, const EncodeOptions& options);

// Decimal rendering without trailing zeros ("2.5", "2").
std::string FormatSeconds(double seconds);

} // namespace slideshow::encoder
