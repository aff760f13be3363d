#pragma once

#include <stdexcept>
#include <string>

namespace slideshow::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  The generation pipeline raises exactly one of NotFound, EmptyInput,
  MissingAsset, StagingFailed or EncodeFailed per failed attempt.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EmptyInput : public std::runtime_error {
 public:
  explicit EmptyInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingAsset : public std::runtime_error {
 public:
  MissingAsset(const std::string& msg, std::string path) : std::runtime_error(msg), path_(std::move(path)) {
  }

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

class StagingFailed : public std::runtime_error {
 public:
  StagingFailed(const std::string& msg, std::string source_path) : std::runtime_error(msg), source_path_(std::move(source_path)) {
  }

  const std::string& source_path() const {
    return source_path_;
  }

 private:
  std::string source_path_;
};

class EncodeFailed : public std::runtime_error {
 public:
  EncodeFailed(const std::string& msg, int exit_code, std::string diagnostics, bool timed_out = false)
      : std::runtime_error(msg), exit_code_(exit_code), diagnostics_(std::move(diagnostics)), timed_out_(timed_out) {
  }

  // -1 when the process never started.
  int exit_code() const {
    return exit_code_;
  }

  const std::string& diagnostics() const {
    return diagnostics_;
  }

  bool timed_out() const {
    return timed_out_;
  }

 private:
  int         exit_code_;
  std::string diagnostics_;
  bool        timed_out_;
};

} // namespace slideshow::util
