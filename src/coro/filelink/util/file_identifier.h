#ifndef CORO_FILELINK_UTIL_FILE_IDENTIFIER_H
#define CORO_FILELINK_UTIL_FILE_IDENTIFIER_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace coro::filelink::util {

// Public identifier of a file: "<container_id>_<item_id>".
struct FileIdentifier {
  int64_t container_id;
  int64_t item_id;

  bool operator==(const FileIdentifier&) const = default;
};

// Returns nullopt unless `file_id` is exactly two integers joined by a single
// '_'.
std::optional<FileIdentifier> ParseFileIdentifier(std::string_view file_id);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_IDENTIFIER_H
