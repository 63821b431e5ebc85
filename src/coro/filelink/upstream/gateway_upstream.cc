#include "coro/filelink/upstream/gateway_upstream.h"

#include <utility>

#include "coro/filelink/file_link_exception.h"
#include "coro/filelink/util/string_utils.h"
#include "coro/http/http_parse.h"

namespace coro::filelink {

namespace {

using ::coro::filelink::util::StrCat;

using Request = http::Request<std::string>;

template <typename T>
std::optional<T> GetOptional(const nlohmann::json& json, std::string_view key) {
  auto it = json.find(std::string(key));
  if (it == json.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename RequestT>
Task<http::Response<>> Fetch(const http::Http& http,
                             std::string_view access_token, RequestT request,
                             stdx::stop_token stop_token) {
  if (!access_token.empty()) {
    request.headers.emplace_back("Authorization",
                                 StrCat("Bearer ", access_token));
  }
  auto response =
      co_await http.Fetch(std::move(request), std::move(stop_token));
  if (response.status == 401) {
    throw FileLinkException(FileLinkException::Type::kUnauthorized);
  } else if (response.status / 100 != 2) {
    std::string body = co_await http::GetBody(std::move(response.body));
    throw http::HttpException(response.status, std::move(body));
  }
  co_return response;
}

template <typename RequestT>
Task<nlohmann::json> FetchJson(const http::Http& http,
                               std::string_view access_token, RequestT request,
                               stdx::stop_token stop_token) {
  request.headers.emplace_back("Accept", "application/json");
  auto response =
      co_await Fetch(http, access_token, std::move(request),
                     std::move(stop_token));
  std::string body = co_await http::GetBody(std::move(response.body));
  co_return nlohmann::json::parse(std::move(body));
}

AbstractUpstream::Document ToDocument(const nlohmann::json& json) {
  return {.file_id = json.at("file_id"),
          .file_name = GetOptional<std::string>(json, "file_name"),
          .file_size = json.at("file_size"),
          .mime_type = GetOptional<std::string>(json, "mime_type")};
}

AbstractUpstream::Video ToVideo(const nlohmann::json& json) {
  return {.file_id = json.at("file_id"),
          .file_name = GetOptional<std::string>(json, "file_name"),
          .file_size = json.at("file_size"),
          .mime_type = GetOptional<std::string>(json, "mime_type"),
          .duration = GetOptional<int64_t>(json, "duration"),
          .width = GetOptional<int64_t>(json, "width"),
          .height = GetOptional<int64_t>(json, "height")};
}

AbstractUpstream::Audio ToAudio(const nlohmann::json& json) {
  return {.file_id = json.at("file_id"),
          .file_name = GetOptional<std::string>(json, "file_name"),
          .file_size = json.at("file_size"),
          .mime_type = GetOptional<std::string>(json, "mime_type"),
          .duration = GetOptional<int64_t>(json, "duration"),
          .performer = GetOptional<std::string>(json, "performer"),
          .title = GetOptional<std::string>(json, "title")};
}

AbstractUpstream::Photo ToPhoto(const nlohmann::json& json) {
  // Photos may come as the list of available sizes, the last being the
  // largest.
  const nlohmann::json& photo = json.is_array() ? json.back() : json;
  return {.file_id = photo.at("file_id"),
          .file_size = photo.at("file_size"),
          .width = GetOptional<int64_t>(photo, "width"),
          .height = GetOptional<int64_t>(photo, "height")};
}

bool HasMember(const nlohmann::json& json, std::string_view key) {
  auto it = json.find(std::string(key));
  return it != json.end() && !it->is_null() &&
         !(it->is_array() && it->empty());
}

}  // namespace

std::optional<AbstractUpstream::MediaKind> GatewayUpstream::ToMediaKind(
    const nlohmann::json& message) {
  if (HasMember(message, "document")) {
    return ToDocument(message.at("document"));
  } else if (HasMember(message, "video")) {
    return ToVideo(message.at("video"));
  } else if (HasMember(message, "audio")) {
    return ToAudio(message.at("audio"));
  } else if (HasMember(message, "photo")) {
    return ToPhoto(message.at("photo"));
  } else {
    return std::nullopt;
  }
}

auto GatewayUpstream::Lookup(int64_t container_id, int64_t item_id,
                             stdx::stop_token stop_token) const
    -> Task<std::optional<Item>> {
  Request request{
      .url = GetEndpoint(StrCat("/messages/", container_id, "/", item_id))};
  nlohmann::json json;
  try {
    json = co_await FetchJson(*http_, config_.token, std::move(request),
                              std::move(stop_token));
  } catch (const http::HttpException& e) {
    if (e.status() == 404) {
      co_return std::nullopt;
    }
    throw;
  }
  co_return Item{.container_id = container_id,
                 .item_id = item_id,
                 .media = ToMediaKind(json),
                 .date = GetOptional<int64_t>(json, "date")};
}

Generator<std::string> GatewayUpstream::FetchBlocks(
    Locator locator, int64_t block_size, stdx::stop_token stop_token) const {
  int64_t offset = 0;
  while (offset < locator.size) {
    Request request{
        .url = StrCat(GetEndpoint(StrCat("/files/",
                                         http::EncodeUri(locator.file_id))),
                      "?",
                      http::FormDataToString(
                          {{"offset", std::to_string(offset)},
                           {"limit", std::to_string(block_size)}}))};
    auto response =
        co_await Fetch(*http_, config_.token, std::move(request), stop_token);
    std::string block = co_await http::GetBody(std::move(response.body));
    if (block.empty()) {
      co_return;
    }
    offset += static_cast<int64_t>(block.size());
    co_yield std::move(block);
  }
}

std::string GatewayUpstream::GetEndpoint(std::string_view path) const {
  std::string_view endpoint = config_.endpoint;
  while (endpoint.ends_with('/')) {
    endpoint.remove_suffix(1);
  }
  return StrCat(endpoint, path);
}

}  // namespace coro::filelink
