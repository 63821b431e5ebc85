#ifndef CORO_FILELINK_UTIL_FILE_CONTENT_HANDLER_H
#define CORO_FILELINK_UTIL_FILE_CONTENT_HANDLER_H

#include "coro/filelink/util/chunked_range_streamer.h"
#include "coro/filelink/util/handler_utils.h"
#include "coro/http/http.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

// Serves /stream/<file_id>[/<filename>] and /download/<file_id>[/<filename>].
// Requests without a filename are redirected to the canonical named path.
struct FileContentHandler {
  using Request = http::Request<>;
  using Response = http::Response<>;

  enum class Mode { kStream, kDownload };

  Task<Response> operator()(Request request, stdx::stop_token stop_token) const;

  Mode mode;
  const FileAccess* file_access;
  const ChunkedRangeStreamer* streamer;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_CONTENT_HANDLER_H
