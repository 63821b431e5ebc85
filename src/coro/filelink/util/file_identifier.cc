#include "coro/filelink/util/file_identifier.h"

#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

std::optional<FileIdentifier> ParseFileIdentifier(std::string_view file_id) {
  std::vector<std::string> parts = SplitStringKeepEmpty(file_id, '_');
  if (parts.size() != 2) {
    return std::nullopt;
  }
  auto container_id = ParseInt64(parts[0]);
  auto item_id = ParseInt64(parts[1]);
  if (!container_id || !item_id) {
    return std::nullopt;
  }
  return FileIdentifier{.container_id = *container_id, .item_id = *item_id};
}

}  // namespace coro::filelink::util
