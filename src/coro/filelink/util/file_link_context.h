#ifndef CORO_FILELINK_UTIL_FILE_LINK_CONTEXT_H
#define CORO_FILELINK_UTIL_FILE_LINK_CONTEXT_H

#include <memory>

#include "coro/filelink/upstream/gateway_upstream.h"
#include "coro/filelink/util/chunked_range_streamer.h"
#include "coro/filelink/util/clock.h"
#include "coro/filelink/util/file_descriptor_resolver.h"
#include "coro/filelink/util/file_link_config.h"
#include "coro/filelink/util/file_link_handler.h"
#include "coro/filelink/util/link_token.h"
#include "coro/filelink/util/metadata_cache.h"
#include "coro/http/http.h"
#include "coro/http/http_server.h"
#include "coro/util/event_loop.h"

namespace coro::filelink::util {

std::unique_ptr<LinkTokenPolicy> CreateLinkTokenPolicy(
    const FileLinkConfig& config);

// Owns the process-wide services. Must outlive every handler and server it
// creates.
class FileLinkContext {
 public:
  FileLinkContext(const coro::util::EventLoop* event_loop,
                  FileLinkConfig config, http::Http http);

  FileLinkContext(FileLinkContext&&) = delete;
  FileLinkContext& operator=(FileLinkContext&&) = delete;

  const FileLinkConfig& config() const { return config_; }

  FileLinkHandler CreateFileLinkHandler() const;
  coro::util::TcpServer CreateHttpServer(coro::http::HttpHandler handler) const;

 private:
  const coro::util::EventLoop* event_loop_;
  FileLinkConfig config_;
  http::Http http_;
  Clock clock_;
  MetadataCache cache_;
  GatewayUpstream upstream_;
  FileDescriptorResolver resolver_;
  ChunkedRangeStreamer streamer_;
  std::unique_ptr<LinkTokenPolicy> link_token_policy_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_LINK_CONTEXT_H
