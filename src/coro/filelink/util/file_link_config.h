#ifndef CORO_FILELINK_UTIL_FILE_LINK_CONFIG_H
#define CORO_FILELINK_UTIL_FILE_LINK_CONFIG_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace coro::filelink::util {

struct FileLinkConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  // Public address of the server, http://localhost:<port> if unset.
  std::optional<std::string> base_url;
  int64_t max_file_size = int64_t(4) * 1024 * 1024 * 1024;
  int64_t chunk_size = 1024 * 1024;
  int64_t cache_ttl = 600;
  std::string upstream_endpoint = "http://127.0.0.1:8081";
  std::string upstream_token;
  std::string secret_key;
  int64_t link_ttl = 3600;
  bool require_link_token = false;
  bool log_requests = true;
};

using GetEnv =
    std::function<std::optional<std::string>(std::string_view name)>;

std::optional<std::string> GetEnvironmentVariable(std::string_view name);

// Reads the JSON file at `path`, if given, then applies overrides from the
// environment. Throws RuntimeError for unreadable files and invalid values.
FileLinkConfig LoadFileLinkConfig(std::optional<std::string> path,
                                  const GetEnv& get_env = GetEnvironmentVariable);

void ValidateFileLinkConfig(const FileLinkConfig& config);

std::string GetBaseUrl(const FileLinkConfig& config);

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_LINK_CONFIG_H
