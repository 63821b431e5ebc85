#include "coro/filelink/util/string_utils.h"

#include <cctype>
#include <charconv>

namespace coro::filelink::util {

std::vector<std::string> SplitStringKeepEmpty(std::string_view string,
                                              char delim) {
  std::vector<std::string> result;
  std::string current;
  for (char c : string) {
    if (c == delim) {
      result.emplace_back(std::move(current));
      current.clear();
    } else {
      current += c;
    }
  }
  result.emplace_back(std::move(current));
  return result;
}

std::string_view TrimWhitespace(std::string_view input) {
  size_t it1 = 0;
  size_t it2 = input.size();
  while (it1 < it2 && std::isspace(static_cast<unsigned char>(input[it1]))) {
    it1++;
  }
  while (it2 > it1 &&
         std::isspace(static_cast<unsigned char>(input[it2 - 1]))) {
    it2--;
  }
  return input.substr(it1, it2 - it1);
}

std::string ToLower(std::string_view input) {
  std::string result(input);
  for (char& c : result) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

std::optional<int64_t> ParseInt64(std::string_view input) {
  if (input.empty()) {
    return std::nullopt;
  }
  int64_t value = 0;
  auto [ptr, ec] =
      std::from_chars(input.data(), input.data() + input.size(), value);
  if (ec != std::errc() || ptr != input.data() + input.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace coro::filelink::util
