#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace slideshow::process {

/*
  Child process runner.

  No shell is involved: argv[0] is resolved through PATH and the rest is
  passed verbatim. stdout and stderr share one pipe so diagnostics keep
  their relative order.
*/

// The binary could not be started at all (not found, not executable).
class SpawnError : public std::runtime_error {
 public:
  SpawnError(const std::string& msg, int error_number) : std::runtime_error(msg), errno_(error_number) {
  }

  int error_number() const {
    return errno_;
  }

 private:
  int errno_;
};

struct ProcessResult {
  // Exit status; 128 + signal number when the child was killed.
  int         exit_code = -1;
  // Tail of the merged stdout/stderr stream.
  std::string diagnostics;
  bool        timed_out = false;
};

inline constexpr std::size_t kDiagnosticTailBytes = 64 * 1024;

// timeout of zero waits forever. Throws SpawnError if argv[0] cannot be started.
ProcessResult RunProcess(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

// Absolute path of an executable, searched on PATH unless name contains '/'.
std::optional<std::string> FindExecutable(const std::string& name);

} // namespace slideshow::process
