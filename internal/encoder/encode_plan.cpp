#include "encode_plan.hpp"

#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace slideshow::encoder {

std::string FormatSeconds(double seconds) {
  std::ostringstream os;
  os << std::setprecision(10) << seconds;
  return os.str();
}

EncodePlan BuildEncodePlan(const std::vector<std::string>& frame_paths, const std::string& output_path,
                           double seconds_per_frame, int32_t fps, const EncodeOptions& options) {
  if (frame_paths.empty()) {
    throw util::InvalidArgument("encode plan needs at least one frame");
  }
  if (!(seconds_per_frame > 0.0)) {
    throw util::InvalidArgument("seconds per frame must be positive");
  }
  if (fps < 1 || fps > 60) {
    throw util::InvalidArgument("fps must be within 1..60");
  }
  if (options.output_width <= 0 || options.output_height <= 0) {
    throw util::InvalidArgument("output resolution must be positive");
  }

  const std::string w        = std::to_string(options.output_width);
  const std::string h        = std::to_string(options.output_height);
  const std::string rate     = std::to_string(fps);
  const std::string duration = FormatSeconds(seconds_per_frame);

  EncodePlan plan;
  auto&      argv = plan.argv;
  argv            = {options.binary, "-hide_banner", "-nostdin", "-loglevel", "error"};

  for (const auto& frame : frame_paths) {
    argv.insert(argv.end(), {"-loop", "1", "-framerate", rate, "-t", duration, "-i", frame});
  }

  std::ostringstream graph;
  for (std::size_t i = 0; i < frame_paths.size(); ++i) {
    graph << '[' << i << ":v]"
          << "scale=" << w << ':' << h << ":force_original_aspect_ratio=decrease,"
          << "pad=" << w << ':' << h << ":(ow-iw)/2:(oh-ih)/2,"
          << "setsar=1,fps=" << rate << ",format=" << options.pixel_format << "[v" << i << "];";
  }
  for (std::size_t i = 0; i < frame_paths.size(); ++i) {
    graph << "[v" << i << ']';
  }
  graph << "concat=n=" << frame_paths.size() << ":v=1:a=0[out]";

  argv.insert(argv.end(), {"-filter_complex", graph.str(), "-map", "[out]", "-r", rate, "-c:v", options.video_codec,
                           "-pix_fmt", options.pixel_format, "-movflags", "+faststart", "-y", output_path});

  plan.expected_duration_seconds = static_cast<double>(frame_paths.size()) * seconds_per_frame;
  return plan;
}

} // namespace slideshow::encoder
