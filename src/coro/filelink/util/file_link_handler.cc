#include "coro/filelink/util/file_link_handler.h"

#include <fmt/format.h>

#include <iostream>
#include <optional>
#include <utility>

#include "coro/filelink/file_link_exception.h"
#include "coro/filelink/util/direct_link_handler.h"
#include "coro/filelink/util/exception_utils.h"
#include "coro/filelink/util/file_content_handler.h"
#include "coro/filelink/util/file_info_handler.h"
#include "coro/filelink/util/handler_utils.h"
#include "coro/filelink/util/health_handler.h"
#include "coro/http/http_parse.h"
#include "coro/stdx/any_invocable.h"

namespace coro::filelink::util {

namespace {

constexpr std::string_view kAllowedMethods = "OPTIONS, GET, HEAD";

Generator<std::string> LogStreamErrors(Generator<std::string> body,
                                       std::string url) {
  try {
    FOR_CO_AWAIT(std::string & chunk, body) { co_yield std::move(chunk); }
  } catch (...) {
    std::cerr << fmt::format("STREAM ERROR {} {}\n", url,
                             ToString(GetErrorMetadata()));
    throw;
  }
}

http::Response<> GetErrorResponse(const FileLinkException& e) {
  switch (e.type()) {
    case FileLinkException::Type::kInvalidIdentifier:
      return GetTextResponse(400, "Invalid file identifier");
    case FileLinkException::Type::kOversizedFile:
      return GetTextResponse(400, "File too large");
    case FileLinkException::Type::kForbidden:
      return GetTextResponse(403, "Forbidden");
    case FileLinkException::Type::kNotFound:
      return GetTextResponse(404, "File not found");
    default:
      return GetTextResponse(500, "Internal server error");
  }
}

bool IsClientError(const FileLinkException& e) {
  switch (e.type()) {
    case FileLinkException::Type::kInvalidIdentifier:
    case FileLinkException::Type::kOversizedFile:
    case FileLinkException::Type::kForbidden:
    case FileLinkException::Type::kNotFound:
      return true;
    default:
      return false;
  }
}

}  // namespace

class FileLinkHandler::Impl {
 public:
  using Request = http::Request<>;
  using Response = http::Response<>;

  Impl(const FileDescriptorResolver* resolver,
       const ChunkedRangeStreamer* streamer,
       const LinkTokenPolicy* link_token_policy, const Clock* clock,
       Config config)
      : streamer_(streamer),
        link_token_policy_(link_token_policy),
        clock_(clock),
        config_(std::move(config)),
        file_access_(resolver, link_token_policy, clock,
                     config_.max_file_size) {}

  Impl(Impl&&) = delete;
  Impl& operator=(Impl&&) = delete;

  Task<Response> operator()(Request request, stdx::stop_token stop_token) const;

 private:
  using Handler = stdx::any_invocable<Task<Response>(Request, stdx::stop_token)>;

  Task<Response> HandleRequest(Request request,
                               stdx::stop_token stop_token) const;

  std::optional<Handler> ChooseHandler(std::string_view path) const;

  const ChunkedRangeStreamer* streamer_;
  const LinkTokenPolicy* link_token_policy_;
  const Clock* clock_;
  Config config_;
  FileAccess file_access_;
};

auto FileLinkHandler::Impl::operator()(Request request,
                                       stdx::stop_token stop_token) const
    -> Task<Response> {
  std::string url = request.url;
  try {
    co_return co_await HandleRequest(std::move(request),
                                     std::move(stop_token));
  } catch (const FileLinkException& e) {
    if (!IsClientError(e)) {
      std::cerr << fmt::format("ERROR {} {}\n", url,
                               ToString(GetErrorMetadata()));
    }
    co_return GetErrorResponse(e);
  } catch (...) {
    std::cerr << fmt::format("ERROR {} {}\n", url,
                             ToString(GetErrorMetadata()));
    co_return GetTextResponse(500, "Internal server error");
  }
}

auto FileLinkHandler::Impl::HandleRequest(Request request,
                                          stdx::stop_token stop_token) const
    -> Task<Response> {
  if (request.method == http::Method::kOptions) {
    co_return Response{
        .status = 204,
        .headers = {{"Allow", std::string(kAllowedMethods)},
                    {"Access-Control-Allow-Origin", "*"},
                    {"Access-Control-Allow-Methods",
                     std::string(kAllowedMethods)},
                    {"Access-Control-Allow-Headers", "*"},
                    {"Access-Control-Expose-Headers",
                     "Content-Length, Content-Range, Accept-Ranges"}}};
  }
  auto path = http::ParseUri(request.url).path;
  if (!path) {
    co_return GetTextResponse(400, "Bad request");
  }
  if (request.method != http::Method::kGet &&
      request.method != http::Method::kHead) {
    auto response = GetTextResponse(405, "Method not allowed");
    response.headers.emplace_back("Allow", std::string(kAllowedMethods));
    co_return response;
  }
  if (auto handler = ChooseHandler(*path)) {
    std::string url = request.url;
    bool has_body = request.method == http::Method::kGet;
    auto response =
        co_await (*handler)(std::move(request), std::move(stop_token));
    if (has_body && (response.status == 200 || response.status == 206)) {
      response.body =
          LogStreamErrors(std::move(response.body), std::move(url));
    }
    co_return response;
  }
  co_return GetTextResponse(404, "Not found");
}

auto FileLinkHandler::Impl::ChooseHandler(std::string_view path) const
    -> std::optional<Handler> {
  if (path.empty() || path == "/" || path == "/health") {
    return HealthHandler{};
  } else if (path.starts_with("/stream/")) {
    return FileContentHandler{.mode = FileContentHandler::Mode::kStream,
                              .file_access = &file_access_,
                              .streamer = streamer_};
  } else if (path.starts_with("/download/")) {
    return FileContentHandler{.mode = FileContentHandler::Mode::kDownload,
                              .file_access = &file_access_,
                              .streamer = streamer_};
  } else if (path.starts_with("/direct/")) {
    return DirectLinkHandler{.file_access = &file_access_};
  } else if (path.starts_with("/info/")) {
    return FileInfoHandler{.file_access = &file_access_,
                           .link_token_policy = link_token_policy_,
                           .clock = clock_,
                           .base_url = config_.base_url};
  } else {
    return std::nullopt;
  }
}

FileLinkHandler::FileLinkHandler(const FileDescriptorResolver* resolver,
                                 const ChunkedRangeStreamer* streamer,
                                 const LinkTokenPolicy* link_token_policy,
                                 const Clock* clock, Config config)
    : impl_(std::make_unique<Impl>(resolver, streamer, link_token_policy,
                                   clock, std::move(config))) {}

FileLinkHandler::FileLinkHandler(FileLinkHandler&&) noexcept = default;

FileLinkHandler::~FileLinkHandler() = default;

FileLinkHandler& FileLinkHandler::operator=(FileLinkHandler&&) noexcept =
    default;

Task<http::Response<>> FileLinkHandler::operator()(
    http::Request<> request, stdx::stop_token stop_token) const {
  return (*impl_)(std::move(request), std::move(stop_token));
}

}  // namespace coro::filelink::util
