#pragma once

#include <stdexcept>
#include <string>

namespace offline::util {

/*
  Central error types.

  The cache path converts all of these into misses / no-ops at the facade.
  Only the sync queue lets them reach the caller.
*/

class CodecError : public std::runtime_error {
 public:
  enum class Kind {
    kCompression,
    kAuthenticationFailed,
    kInternal,
  };

  CodecError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

class StoreError : public std::runtime_error {
 public:
  enum class Kind {
    kWriteFailed,
    kReadFailed,
    kUnavailable,
  };

  StoreError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

class QueueError : public std::runtime_error {
 public:
  enum class Kind {
    kDrainInProgress,
    kPermanentFailure,
  };

  QueueError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace offline::util
