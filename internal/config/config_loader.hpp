#pragma once

#include <string>

#include "config/config.pb.h"

namespace slideshow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled with their documented defaults and the result is
  validated before it is handed to the composition root.
*/
class ConfigLoader {
 public:
  static slideshow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(slideshow::runtime::config::RuntimeConfig& config);
  static void Validate(const slideshow::runtime::config::RuntimeConfig& config);
};

} // namespace slideshow::config
