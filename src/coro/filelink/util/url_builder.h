#ifndef CORO_FILELINK_UTIL_URL_BUILDER_H
#define CORO_FILELINK_UTIL_URL_BUILDER_H

#include <optional>
#include <string>
#include <string_view>

namespace coro::filelink::util {

struct FileLinks {
  std::string download;
  std::string download_named;
  std::string stream;
  std::string stream_named;
  std::string direct;
  std::string info;

  bool operator==(const FileLinks&) const = default;
};

// Public links for a file. The filename goes through GenerateSafeFilename and
// is percent-encoded. When `token` is set every link carries it as the `token`
// query parameter.
FileLinks BuildUrls(std::string_view file_id, std::string_view filename,
                    std::string_view base_url,
                    std::optional<std::string_view> token = std::nullopt);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_URL_BUILDER_H
