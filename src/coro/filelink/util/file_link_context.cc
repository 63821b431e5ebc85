#include "coro/filelink/util/file_link_context.h"

#include <utility>

namespace coro::filelink::util {

std::unique_ptr<LinkTokenPolicy> CreateLinkTokenPolicy(
    const FileLinkConfig& config) {
  if (config.require_link_token) {
    return std::make_unique<HmacLinkTokenPolicy>(config.secret_key,
                                                 config.link_ttl);
  } else {
    return std::make_unique<AllowAllLinkTokenPolicy>();
  }
}

FileLinkContext::FileLinkContext(const coro::util::EventLoop* event_loop,
                                 FileLinkConfig config, http::Http http)
    : event_loop_(event_loop),
      config_(std::move(config)),
      http_(std::move(http)),
      cache_(config_.cache_ttl),
      upstream_(&http_, GatewayUpstream::Config{
                            .endpoint = config_.upstream_endpoint,
                            .token = config_.upstream_token}),
      resolver_(&upstream_, &cache_, &clock_),
      streamer_(&upstream_, config_.chunk_size),
      link_token_policy_(CreateLinkTokenPolicy(config_)) {}

FileLinkHandler FileLinkContext::CreateFileLinkHandler() const {
  return FileLinkHandler(&resolver_, &streamer_, link_token_policy_.get(),
                         &clock_,
                         FileLinkHandler::Config{
                             .max_file_size = config_.max_file_size,
                             .base_url = GetBaseUrl(config_)});
}

coro::util::TcpServer FileLinkContext::CreateHttpServer(
    coro::http::HttpHandler handler) const {
  return coro::http::CreateHttpServer(
      std::move(handler), event_loop_,
      coro::util::TcpServer::Config{
          .address = config_.host,
          .port = static_cast<uint16_t>(config_.port)});
}

}  // namespace coro::filelink::util
