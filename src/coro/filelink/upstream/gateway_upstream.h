#ifndef CORO_FILELINK_UPSTREAM_GATEWAY_UPSTREAM_H
#define CORO_FILELINK_UPSTREAM_GATEWAY_UPSTREAM_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "coro/filelink/abstract_upstream.h"
#include "coro/http/http.h"

namespace coro::filelink {

// Talks to an HTTP gateway in front of the messaging platform:
//
//   GET <endpoint>/messages/<container_id>/<item_id>
//     JSON message with an optional "document", "video", "audio" or "photo"
//     member, 404 if there is no such message.
//   GET <endpoint>/files/<file_id>?offset=<offset>&limit=<limit>
//     Raw bytes of the file starting at `offset`, at most `limit` of them.
class GatewayUpstream : public AbstractUpstream {
 public:
  struct Config {
    std::string endpoint;
    std::string token;
  };

  GatewayUpstream(const http::Http* http, Config config)
      : http_(http), config_(std::move(config)) {}

  Task<std::optional<Item>> Lookup(int64_t container_id, int64_t item_id,
                                   stdx::stop_token stop_token) const override;

  Generator<std::string> FetchBlocks(
      Locator locator, int64_t block_size,
      stdx::stop_token stop_token) const override;

  static std::optional<MediaKind> ToMediaKind(const nlohmann::json& message);

 private:
  std::string GetEndpoint(std::string_view path) const;

  const http::Http* http_;
  Config config_;
};

}  // namespace coro::filelink

#endif  // CORO_FILELINK_UPSTREAM_GATEWAY_UPSTREAM_H
