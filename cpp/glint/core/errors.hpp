#pragma once
/*
================================================================================
Core: Error Types
FILE: cpp/glint/core/errors.hpp

Purpose:
  - One exception hierarchy for the whole library so failures are:
      * catchable by category (config vs. I/O vs. deliberate fatal)
      * reportable by tools as distinct exit codes

Hardening:
  - Small, dependency-free exceptions.
  - Safe what() storage via std::string.
  - The logger never catches these; every one reaches the caller.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace glint {

// Base error for the library.
class GlintError : public std::runtime_error {
 public:
  explicit GlintError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown for invalid configuration: bad template, missing color entry,
// unknown level/color name, malformed settings file line.
class ConfigError : public GlintError {
 public:
  explicit ConfigError(std::string msg) : GlintError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public GlintError {
 public:
  IOError(std::string msg, std::string path, int errno_value = 0)
      : GlintError(std::move(msg)), path_(std::move(path)), errno_(errno_value) {}

  const std::string& path() const noexcept { return path_; }

  // errno observed at the failure point (0 if none was available).
  int error_number() const noexcept { return errno_; }

 private:
  std::string path_;
  int errno_;
};

// Thrown after a FATAL log has been written to every sink.
// what() is "Fatal error: " + message.
class FatalError : public GlintError {
 public:
  explicit FatalError(const std::string& message)
      : GlintError("Fatal error: " + message), message_(message) {}

  // The raw message that was logged.
  const std::string& message() const noexcept { return message_; }

 private:
  std::string message_;
};

} // namespace glint
