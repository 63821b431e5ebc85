#ifndef CORO_FILELINK_UTIL_GENERATOR_UTILS_H
#define CORO_FILELINK_UTIL_GENERATOR_UTILS_H

#include <string>

#include "coro/generator.h"

namespace coro::filelink::util {

inline Generator<std::string> ToGenerator(std::string chunk) {
  co_yield std::move(chunk);
}

inline Generator<std::string> EmptyGenerator() { co_return; }

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_GENERATOR_UTILS_H
