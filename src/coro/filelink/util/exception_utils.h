#ifndef CORO_FILELINK_UTIL_EXCEPTION_UTILS_H
#define CORO_FILELINK_UTIL_EXCEPTION_UTILS_H

#include <exception>
#include <optional>
#include <string>

#include "coro/stdx/source_location.h"
#include "coro/stdx/stacktrace.h"

namespace coro::filelink::util {

struct ErrorMetadata {
  std::optional<int> status;
  std::string what;
  std::optional<stdx::source_location> source_location;
  std::optional<stdx::stacktrace> stacktrace;
};

ErrorMetadata GetErrorMetadata(
    const std::exception_ptr& = std::current_exception());

std::string ToString(const ErrorMetadata&);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_EXCEPTION_UTILS_H
