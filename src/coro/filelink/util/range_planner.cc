#include "coro/filelink/util/range_planner.h"

#include <fmt/format.h>

#include "coro/filelink/util/string_utils.h"
#include "coro/util/regex.h"

namespace coro::filelink::util {

namespace re = coro::util::re;

RangePlan PlanRange(std::optional<std::string_view> range_header,
                    int64_t size) {
  if (!range_header) {
    return FullContent{};
  }
  std::string header(TrimWhitespace(*range_header));
  re::smatch results;
  if (!re::regex_match(header, results, re::regex(R"(bytes=(\d*)-(\d*))"))) {
    return FullContent{};
  }
  std::string start_str = results[1].str();
  std::string end_str = results[2].str();
  std::optional<int64_t> start = start_str.empty()
                                     ? std::make_optional<int64_t>(0)
                                     : ParseInt64(start_str);
  std::optional<int64_t> end = end_str.empty()
                                   ? std::make_optional<int64_t>(size - 1)
                                   : ParseInt64(end_str);
  if (!start || !end) {
    // Too large to fit in int64_t, so past the end of any file.
    return Unsatisfiable{};
  }
  if (*start >= size || *end >= size || *start > *end) {
    return Unsatisfiable{};
  }
  return PartialContent{.range = {.start = *start, .end = *end}};
}

ByteRange GetByteRange(const RangePlan& plan, int64_t size) {
  if (const auto* partial = std::get_if<PartialContent>(&plan)) {
    return partial->range;
  }
  return ByteRange{.start = 0, .end = size - 1};
}

std::string GetContentRange(const RangePlan& plan, int64_t size) {
  if (const auto* partial = std::get_if<PartialContent>(&plan)) {
    return fmt::format("bytes {}-{}/{}", partial->range.start,
                       partial->range.end, size);
  }
  return fmt::format("bytes */{}", size);
}

}  // namespace coro::filelink::util
