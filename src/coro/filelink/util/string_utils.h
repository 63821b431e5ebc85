#ifndef CORO_FILELINK_UTIL_STRING_UTILS_H
#define CORO_FILELINK_UTIL_STRING_UTILS_H

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace coro::filelink::util {

template <typename T>
std::string ToString(T d) {
  std::stringstream stream;
  stream << std::move(d);
  return std::move(stream).str();
}

inline std::string ToString(std::string_view sv) { return std::string(sv); }

inline std::string StrCat() { return ""; }

template <typename Head, typename... Tail>
std::string StrCat(Head&& head, Tail&&... tail) {
  std::string result = ToString(std::forward<Head>(head));
  result += StrCat(std::forward<Tail>(tail)...);
  return result;
}

// Keeps empty components: "a__b" splits into three.
std::vector<std::string> SplitStringKeepEmpty(std::string_view string,
                                              char delim);

std::string_view TrimWhitespace(std::string_view input);

std::string ToLower(std::string_view input);

// Parses the whole of `input` as a base-10 integer with an optional leading
// '-'. Returns nullopt on empty input, trailing garbage or overflow.
std::optional<int64_t> ParseInt64(std::string_view input);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_STRING_UTILS_H
