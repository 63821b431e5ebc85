#ifndef CORO_FILELINK_UTIL_CLOCK_H
#define CORO_FILELINK_UTIL_CLOCK_H

#include <cstdint>

namespace coro::filelink::util {

// Wall clock in seconds since the epoch.
class Clock {
 public:
  virtual ~Clock() = default;

  virtual int64_t Now() const;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_CLOCK_H
