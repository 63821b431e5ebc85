#include "coro/filelink/util/file_link_config.h"

#include <fmt/format.h>

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

#include "coro/exception.h"
#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

namespace {

nlohmann::json ReadConfigFile(const std::string& path) {
  std::ifstream stream(path, std::fstream::binary);
  if (!stream) {
    throw RuntimeError(fmt::format("can't open config file {}", path));
  }
  try {
    return nlohmann::json::parse(stream);
  } catch (const nlohmann::json::exception& e) {
    throw RuntimeError(
        fmt::format("malformed config file {}: {}", path, e.what()));
  }
}

int ToPort(int64_t port) {
  if (port < 0 || port > 65535) {
    throw RuntimeError(fmt::format("port out of range: {}", port));
  }
  return static_cast<int>(port);
}

void ApplyJson(const nlohmann::json& json, FileLinkConfig& config) {
  if (!json.is_object()) {
    throw RuntimeError("config file must hold a JSON object");
  }
  try {
    if (json.contains("host")) {
      config.host = json.at("host").get<std::string>();
    }
    if (json.contains("port")) {
      config.port = ToPort(json.at("port").get<int64_t>());
    }
    if (json.contains("base_url")) {
      config.base_url = json.at("base_url").get<std::string>();
    }
    if (json.contains("max_file_size")) {
      config.max_file_size = json.at("max_file_size").get<int64_t>();
    }
    if (json.contains("chunk_size")) {
      config.chunk_size = json.at("chunk_size").get<int64_t>();
    }
    if (json.contains("cache_ttl")) {
      config.cache_ttl = json.at("cache_ttl").get<int64_t>();
    }
    if (json.contains("upstream_endpoint")) {
      config.upstream_endpoint = json.at("upstream_endpoint").get<std::string>();
    }
    if (json.contains("upstream_token")) {
      config.upstream_token = json.at("upstream_token").get<std::string>();
    }
    if (json.contains("secret_key")) {
      config.secret_key = json.at("secret_key").get<std::string>();
    }
    if (json.contains("link_ttl")) {
      config.link_ttl = json.at("link_ttl").get<int64_t>();
    }
    if (json.contains("require_link_token")) {
      config.require_link_token = json.at("require_link_token").get<bool>();
    }
    if (json.contains("log_requests")) {
      config.log_requests = json.at("log_requests").get<bool>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw RuntimeError(fmt::format("invalid config value: {}", e.what()));
  }
}

int64_t ParseIntVariable(std::string_view name, std::string_view value) {
  auto result = ParseInt64(TrimWhitespace(value));
  if (!result) {
    throw RuntimeError(fmt::format("{} is not an integer: {}", name, value));
  }
  return *result;
}

bool ParseBoolVariable(std::string_view name, std::string_view value) {
  std::string lower = ToLower(TrimWhitespace(value));
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  } else if (lower == "0" || lower == "false" || lower == "no" ||
             lower == "off") {
    return false;
  } else {
    throw RuntimeError(fmt::format("{} is not a boolean: {}", name, value));
  }
}

void ApplyEnvironment(const GetEnv& get_env, FileLinkConfig& config) {
  if (auto value = get_env("HOST")) {
    config.host = *value;
  }
  if (auto value = get_env("PORT")) {
    config.port = ToPort(ParseIntVariable("PORT", *value));
  }
  if (auto value = get_env("BASE_URL")) {
    config.base_url = *value;
  }
  if (auto value = get_env("MAX_FILE_SIZE")) {
    config.max_file_size = ParseIntVariable("MAX_FILE_SIZE", *value);
  }
  if (auto value = get_env("CHUNK_SIZE")) {
    config.chunk_size = ParseIntVariable("CHUNK_SIZE", *value);
  }
  if (auto value = get_env("CACHE_TTL")) {
    config.cache_ttl = ParseIntVariable("CACHE_TTL", *value);
  }
  if (auto value = get_env("UPSTREAM_ENDPOINT")) {
    config.upstream_endpoint = *value;
  }
  if (auto value = get_env("UPSTREAM_TOKEN")) {
    config.upstream_token = *value;
  }
  if (auto value = get_env("SECRET_KEY")) {
    config.secret_key = *value;
  }
  if (auto value = get_env("LINK_TTL")) {
    config.link_ttl = ParseIntVariable("LINK_TTL", *value);
  }
  if (auto value = get_env("REQUIRE_LINK_TOKEN")) {
    config.require_link_token = ParseBoolVariable("REQUIRE_LINK_TOKEN", *value);
  }
  if (auto value = get_env("LOG_REQUESTS")) {
    config.log_requests = ParseBoolVariable("LOG_REQUESTS", *value);
  }
}

}  // namespace

std::optional<std::string> GetEnvironmentVariable(std::string_view name) {
  const char* value = std::getenv(std::string(name).c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

FileLinkConfig LoadFileLinkConfig(std::optional<std::string> path,
                                  const GetEnv& get_env) {
  FileLinkConfig config;
  if (path) {
    ApplyJson(ReadConfigFile(*path), config);
  }
  ApplyEnvironment(get_env, config);
  ValidateFileLinkConfig(config);
  return config;
}

void ValidateFileLinkConfig(const FileLinkConfig& config) {
  if (config.port < 0 || config.port > 65535) {
    throw RuntimeError(fmt::format("invalid port {}", config.port));
  }
  if (config.chunk_size <= 0) {
    throw RuntimeError(
        fmt::format("chunk_size must be positive, got {}", config.chunk_size));
  }
  if (config.max_file_size < 0) {
    throw RuntimeError(fmt::format("max_file_size must not be negative, got {}",
                                   config.max_file_size));
  }
  if (config.cache_ttl < 0) {
    throw RuntimeError(fmt::format("cache_ttl must not be negative, got {}",
                                   config.cache_ttl));
  }
  if (config.link_ttl <= 0) {
    throw RuntimeError(
        fmt::format("link_ttl must be positive, got {}", config.link_ttl));
  }
  if (config.upstream_endpoint.empty()) {
    throw RuntimeError("upstream_endpoint must not be empty");
  }
  if (config.require_link_token && config.secret_key.empty()) {
    throw RuntimeError("require_link_token needs a secret_key");
  }
}

std::string GetBaseUrl(const FileLinkConfig& config) {
  std::string base_url = config.base_url.value_or(
      StrCat("http://localhost:", config.port));
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  return base_url;
}

}  // namespace coro::filelink::util
