#ifndef CORO_FILELINK_UTIL_HANDLER_UTILS_H
#define CORO_FILELINK_UTIL_HANDLER_UTILS_H

#include <optional>
#include <string>
#include <string_view>

#include "coro/filelink/util/chunked_range_streamer.h"
#include "coro/filelink/util/clock.h"
#include "coro/filelink/util/file_descriptor.h"
#include "coro/filelink/util/file_descriptor_resolver.h"
#include "coro/filelink/util/link_token.h"
#include "coro/filelink/util/range_planner.h"
#include "coro/http/http.h"
#include "coro/http/http_parse.h"

namespace coro::filelink::util {

struct FilePath {
  std::string file_id;
  std::optional<std::string> filename;
};

// Matches "/<prefix>/<file_id>" and "/<prefix>/<file_id>/<filename>".
std::optional<FilePath> ParseFilePath(std::string_view path,
                                      std::string_view prefix);

std::optional<std::string> GetQueryParameter(std::string_view url,
                                             std::string_view name);

std::string GetContentDisposition(std::string_view disposition,
                                  std::string_view filename);

// Location of the canonical "/<prefix>/<file_id>/<name>" path, keeping the
// query string of `url`.
std::string GetNamedLocation(std::string_view url, std::string_view prefix,
                             const FileDescriptor& descriptor);

http::Response<> GetTextResponse(int status, std::string message);

http::Response<> GetRedirectResponse(std::string location);

// Resolves the file a request points at. Throws FileLinkException:
// kInvalidIdentifier for a malformed id, kForbidden if the link token is
// rejected and kNotFound if the upstream has no such file.
class FileAccess {
 public:
  FileAccess(const FileDescriptorResolver* resolver,
             const LinkTokenPolicy* link_token_policy, const Clock* clock,
             int64_t max_file_size)
      : resolver_(resolver),
        link_token_policy_(link_token_policy),
        clock_(clock),
        max_file_size_(max_file_size) {}

  Task<FileDescriptor> operator()(std::string file_id,
                                  std::optional<std::string> token,
                                  stdx::stop_token stop_token) const;

  // Throws FileLinkException of type kOversizedFile if `descriptor` exceeds
  // the configured ceiling.
  void CheckFileSize(const FileDescriptor& descriptor) const;

 private:
  const FileDescriptorResolver* resolver_;
  const LinkTokenPolicy* link_token_policy_;
  const Clock* clock_;
  int64_t max_file_size_;
};

struct FileContentOptions {
  std::string content_type;
  std::string content_disposition;
  bool head_only;
  bool mobile;
};

// Response for a planned range of `descriptor`. The body is produced lazily by
// `streamer`; HEAD requests and unsatisfiable ranges never pull from it.
http::Response<> GetFileContentResponse(const ChunkedRangeStreamer* streamer,
                                        const FileDescriptor& descriptor,
                                        const RangePlan& plan,
                                        FileContentOptions options,
                                        stdx::stop_token stop_token);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_HANDLER_UTILS_H
