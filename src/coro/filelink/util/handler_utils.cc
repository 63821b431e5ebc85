#include "coro/filelink/util/handler_utils.h"

#include <fmt/format.h>

#include <utility>
#include <vector>

#include "coro/filelink/file_link_exception.h"
#include "coro/filelink/util/file_identifier.h"
#include "coro/filelink/util/generator_utils.h"
#include "coro/filelink/util/media_utils.h"
#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

namespace {

constexpr int kCacheMaxAge = 3600;
constexpr int kMobileCacheMaxAge = 1800;

}  // namespace

std::optional<FilePath> ParseFilePath(std::string_view path,
                                      std::string_view prefix) {
  std::string expected_prefix = StrCat("/", prefix, "/");
  if (!path.starts_with(expected_prefix)) {
    return std::nullopt;
  }
  path.remove_prefix(expected_prefix.size());
  auto separator = path.find('/');
  std::string file_id = http::DecodeUri(path.substr(0, separator));
  if (file_id.empty()) {
    return std::nullopt;
  }
  FilePath result{.file_id = std::move(file_id)};
  if (separator != std::string_view::npos &&
      separator + 1 < path.size()) {
    result.filename = http::DecodeUri(path.substr(separator + 1));
  }
  return result;
}

std::optional<std::string> GetQueryParameter(std::string_view url,
                                             std::string_view name) {
  auto uri = http::ParseUri(std::string(url));
  if (!uri.query) {
    return std::nullopt;
  }
  auto query = http::ParseQuery(*uri.query);
  auto it = query.find(std::string(name));
  if (it == std::end(query)) {
    return std::nullopt;
  }
  return it->second;
}

std::string GetContentDisposition(std::string_view disposition,
                                  std::string_view filename) {
  std::string escaped;
  for (char c : filename) {
    if (c == '\r' || c == '\n') {
      continue;
    }
    if (c == '"' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  return fmt::format("{}; filename=\"{}\"", disposition, escaped);
}

std::string GetNamedLocation(std::string_view url, std::string_view prefix,
                             const FileDescriptor& descriptor) {
  std::string location =
      StrCat("/", prefix, "/", http::EncodeUri(descriptor.file_id), "/",
             http::EncodeUri(GenerateSafeFilename(descriptor.name)));
  if (auto query = http::ParseUri(std::string(url)).query;
      query && !query->empty()) {
    location += StrCat("?", *query);
  }
  return location;
}

http::Response<> GetTextResponse(int status, std::string message) {
  auto length = message.size();
  return http::Response<>{
      .status = status,
      .headers = {{"Content-Type", "text/plain; charset=UTF-8"},
                  {"Content-Length", std::to_string(length)},
                  {"Access-Control-Allow-Origin", "*"}},
      .body = ToGenerator(std::move(message))};
}

http::Response<> GetRedirectResponse(std::string location) {
  return http::Response<>{
      .status = 302,
      .headers = {{"Location", std::move(location)},
                  {"Content-Length", "0"},
                  {"Access-Control-Allow-Origin", "*"}}};
}

Task<FileDescriptor> FileAccess::operator()(
    std::string file_id, std::optional<std::string> token,
    stdx::stop_token stop_token) const {
  if (!ParseFileIdentifier(file_id)) {
    throw FileLinkException(FileLinkException::Type::kInvalidIdentifier);
  }
  if (!link_token_policy_->Verify(
          file_id,
          token ? std::make_optional<std::string_view>(*token) : std::nullopt,
          clock_->Now())) {
    throw FileLinkException(FileLinkException::Type::kForbidden);
  }
  co_return co_await (*resolver_)(std::move(file_id), std::move(stop_token));
}

void FileAccess::CheckFileSize(const FileDescriptor& descriptor) const {
  if (descriptor.size > max_file_size_) {
    throw FileLinkException(FileLinkException::Type::kOversizedFile);
  }
}

http::Response<> GetFileContentResponse(const ChunkedRangeStreamer* streamer,
                                        const FileDescriptor& descriptor,
                                        const RangePlan& plan,
                                        FileContentOptions options,
                                        stdx::stop_token stop_token) {
  std::vector<std::pair<std::string, std::string>> headers = {
      {"Content-Type", std::move(options.content_type)},
      {"Content-Disposition", std::move(options.content_disposition)},
      {"Accept-Ranges", "bytes"},
      {"Cache-Control",
       fmt::format("public, max-age={}",
                   options.mobile ? kMobileCacheMaxAge : kCacheMaxAge)},
      {"Access-Control-Allow-Origin", "*"},
      {"X-Content-Type-Options", "nosniff"}};
  if (std::holds_alternative<Unsatisfiable>(plan)) {
    headers.emplace_back("Content-Range",
                         GetContentRange(plan, descriptor.size));
    headers.emplace_back("Content-Length", "0");
    return http::Response<>{.status = 416, .headers = std::move(headers)};
  }
  if (descriptor.size == 0) {
    headers.emplace_back("Content-Length", "0");
    http::Response<> response{.status = 200, .headers = std::move(headers)};
    if (!options.head_only) {
      response.body = EmptyGenerator();
    }
    return response;
  }
  ByteRange range = GetByteRange(plan, descriptor.size);
  bool partial = std::holds_alternative<PartialContent>(plan);
  headers.emplace_back("Content-Length", std::to_string(range.size()));
  if (partial) {
    headers.emplace_back("Content-Range",
                         GetContentRange(plan, descriptor.size));
  }
  http::Response<> response{.status = partial ? 206 : 200,
                            .headers = std::move(headers)};
  if (!options.head_only) {
    response.body = (*streamer)(descriptor, range, std::move(stop_token));
  }
  return response;
}

}  // namespace coro::filelink::util
