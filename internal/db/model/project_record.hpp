#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "slideshow/v1/types.pb.h"

namespace slideshow::db::model {

/*
  Persistent project row.

  IMPORTANT:
  - status reflects the most recent generation attempt only.
  - output_path is set iff the most recent successful attempt produced it;
    a failed attempt leaves the previous value in place.
*/

struct ProjectRecord {
  int64_t     id = 0;
  std::string name;

  slideshow::v1::ProjectStatus status = slideshow::v1::PROJECT_STATUS_PENDING;

  std::optional<std::string> output_path;

  double  duration_per_image = 2.0;
  int32_t fps                = 30;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

}
