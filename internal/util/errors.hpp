#pragma once

#include <stdexcept>
#include <string>

namespace runlens::util {

/*
  Central error types.

  Duplicate files, non-running activities and insufficient data are
  outcomes, not errors, and never surface here.
*/

// A classifier or analytics input outside its documented domain.
class InvalidMetricInput : public std::runtime_error {
 public:
  explicit InvalidMetricInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage layer failed; fatal for the current operation.
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace runlens::util
