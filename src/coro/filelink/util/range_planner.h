#ifndef CORO_FILELINK_UTIL_RANGE_PLANNER_H
#define CORO_FILELINK_UTIL_RANGE_PLANNER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace coro::filelink::util {

// Inclusive byte interval.
struct ByteRange {
  int64_t start;
  int64_t end;

  int64_t size() const { return end - start + 1; }

  bool operator==(const ByteRange&) const = default;
};

struct FullContent {
  bool operator==(const FullContent&) const = default;
};

struct PartialContent {
  ByteRange range;

  bool operator==(const PartialContent&) const = default;
};

struct Unsatisfiable {
  bool operator==(const Unsatisfiable&) const = default;
};

using RangePlan = std::variant<FullContent, PartialContent, Unsatisfiable>;

// Plans the response for a `Range` header against a file of `size` bytes.
//
// Only a single "bytes=<start>?-<end>?" range is understood, anything else is
// served as full content. An omitted start means 0 and an omitted end means
// the last byte, so "bytes=-N" covers [0, N] rather than the last N bytes.
RangePlan PlanRange(std::optional<std::string_view> range_header, int64_t size);

// Range of bytes a plan sends. Must not be called with Unsatisfiable or for
// full content of an empty file.
ByteRange GetByteRange(const RangePlan& plan, int64_t size);

// Value of the Content-Range header for 206 and 416 responses.
std::string GetContentRange(const RangePlan& plan, int64_t size);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_RANGE_PLANNER_H
