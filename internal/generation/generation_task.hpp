#pragma once

#include <cstdint>

#include "single_flight.hpp"

namespace slideshow::generation {

/*
  A queued background generation attempt.

  Holds the project's single-flight lease until the attempt finishes or
  the task is dropped.
*/
struct GenerationTask {
  int64_t             project_id = 0;
  SingleFlight::Lease lease;
};

}
