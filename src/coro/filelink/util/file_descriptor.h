#ifndef CORO_FILELINK_UTIL_FILE_DESCRIPTOR_H
#define CORO_FILELINK_UTIL_FILE_DESCRIPTOR_H

#include <cstdint>
#include <optional>
#include <string>

#include "coro/filelink/abstract_upstream.h"

namespace coro::filelink::util {

enum class FileCategory { kVideo, kAudio, kDocument, kImage, kUnknown };

struct FileDescriptor {
  std::string file_id;
  std::string name;
  int64_t size;
  std::string mime_type;
  FileCategory category;
  bool streamable;
  AbstractUpstream::Locator upstream_locator;

  std::optional<int64_t> duration;
  std::optional<int64_t> width;
  std::optional<int64_t> height;
  std::optional<std::string> performer;
  std::optional<std::string> title;
  std::optional<int64_t> date;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_DESCRIPTOR_H
