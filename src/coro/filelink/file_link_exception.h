#ifndef CORO_FILELINK_FILE_LINK_EXCEPTION_H
#define CORO_FILELINK_FILE_LINK_EXCEPTION_H

#include <string>

#include "coro/exception.h"

namespace coro::filelink {

class FileLinkException : public Exception {
 public:
  enum class Type {
    kInvalidIdentifier,
    kNotFound,
    kOversizedFile,
    kForbidden,
    kUnauthorized,
    kUnknown
  };

  explicit FileLinkException(
      std::string message,
      stdx::source_location location = stdx::source_location::current())
      : Exception(std::move(location)),
        type_(Type::kUnknown),
        message_(std::move(message)) {}

  explicit FileLinkException(Type type, stdx::source_location location =
                                            stdx::source_location::current())
      : Exception(std::move(location)),
        type_(type),
        message_(std::string("FileLinkException: ") + TypeToString(type)) {}

  Type type() const { return type_; }
  const char* what() const noexcept final { return message_.c_str(); }

  static const char* TypeToString(Type type) {
    switch (type) {
      case Type::kInvalidIdentifier:
        return "InvalidIdentifier";
      case Type::kNotFound:
        return "NotFound";
      case Type::kOversizedFile:
        return "OversizedFile";
      case Type::kForbidden:
        return "Forbidden";
      case Type::kUnauthorized:
        return "Unauthorized";
      default:
        return "Unknown";
    }
  }

 private:
  Type type_;
  std::string message_;
};

}  // namespace coro::filelink

#endif  // CORO_FILELINK_FILE_LINK_EXCEPTION_H
