#ifndef CORO_FILELINK_UTIL_FILE_LINK_HANDLER_H
#define CORO_FILELINK_UTIL_FILE_LINK_HANDLER_H

#include <cstdint>
#include <memory>
#include <string>

#include "coro/filelink/util/chunked_range_streamer.h"
#include "coro/filelink/util/clock.h"
#include "coro/filelink/util/file_descriptor_resolver.h"
#include "coro/filelink/util/link_token.h"
#include "coro/http/http.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

// Entry point of the HTTP server. Routes requests to the per-endpoint handlers
// and turns FileLinkException into 400, 403 and 404 responses. Other errors
// raised before the response is returned become 500.
class FileLinkHandler {
 public:
  struct Config {
    int64_t max_file_size;
    std::string base_url;
  };

  FileLinkHandler(const FileDescriptorResolver* resolver,
                  const ChunkedRangeStreamer* streamer,
                  const LinkTokenPolicy* link_token_policy, const Clock* clock,
                  Config config);
  FileLinkHandler(FileLinkHandler&&) noexcept;
  FileLinkHandler(const FileLinkHandler&) = delete;
  ~FileLinkHandler();

  FileLinkHandler& operator=(const FileLinkHandler&) = delete;
  FileLinkHandler& operator=(FileLinkHandler&&) noexcept;

  Task<http::Response<>> operator()(http::Request<> request,
                                    stdx::stop_token stop_token) const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_LINK_HANDLER_H
