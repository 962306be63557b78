#pragma once

#include <string>
#include <utility>

// Result of a fallible operation, modelled on RocksDB's Status.
class Status {
public:
  enum Code {
    kOk = 0,
    kNotFound,
    kCorruption,
    kInvalidArgument,
    kIOError,
    kPermissionDenied,
  };

  // Default constructor creates an OK status.
  Status() : code_(kOk), msg_("") {}

  Status(Code code, std::string msg) : code_(code), msg_(std::move(msg)) {}

  Status(const Status &other) = default;
  Status(Status &&other) noexcept = default;
  Status &operator=(const Status &other) = default;
  Status &operator=(Status &&other) noexcept = default;

  bool ok() const { return code_ == kOk; }
  bool is_not_found() const { return code_ == kNotFound; }
  bool is_corruption() const { return code_ == kCorruption; }
  bool is_invalid_argument() const { return code_ == kInvalidArgument; }
  bool is_io_error() const { return code_ == kIOError; }
  bool is_permission_denied() const { return code_ == kPermissionDenied; }

  Code code() const { return code_; }
  const std::string &message() const { return msg_; }

  // Returns a human-readable string representation of this status.
  std::string ToString() const {
    if (ok()) {
      return "OK";
    } else {
      return CodeToString(code_) + ": " + msg_;
    }
  }

  // Factory methods for common statuses.
  static Status OK() { return Status(); }
  static Status NotFound(const std::string &msg) {
    return Status(kNotFound, msg);
  }
  static Status Corruption(const std::string &msg) {
    return Status(kCorruption, msg);
  }
  static Status InvalidArgument(const std::string &msg) {
    return Status(kInvalidArgument, msg);
  }
  static Status IOError(const std::string &msg) {
    return Status(kIOError, msg);
  }
  static Status PermissionDenied(const std::string &msg) {
    return Status(kPermissionDenied, msg);
  }

  bool operator==(const Status &other) const {
    return code_ == other.code_ && msg_ == other.msg_;
  }
  bool operator!=(const Status &other) const { return !(*this == other); }

private:
  Code code_;
  std::string msg_;

  static std::string CodeToString(Code code) {
    switch (code) {
    case kOk:
      return "OK";
    case kNotFound:
      return "NotFound";
    case kCorruption:
      return "Corruption";
    case kInvalidArgument:
      return "InvalidArgument";
    case kIOError:
      return "IOError";
    case kPermissionDenied:
      return "PermissionDenied";
    default:
      return "UnknownError";
    }
  }
};
