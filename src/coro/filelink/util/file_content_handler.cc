#include "coro/filelink/util/file_content_handler.h"

#include "coro/exception.h"
#include "coro/filelink/util/media_utils.h"

namespace coro::filelink::util {

namespace {

std::string_view GetPrefix(FileContentHandler::Mode mode) {
  switch (mode) {
    case FileContentHandler::Mode::kStream:
      return "stream";
    case FileContentHandler::Mode::kDownload:
      return "download";
  }
  throw RuntimeError("invalid mode");
}

}  // namespace

auto FileContentHandler::operator()(Request request,
                                    stdx::stop_token stop_token) const
    -> Task<Response> {
  std::string_view prefix = GetPrefix(mode);
  auto path = ParseFilePath(http::ParseUri(request.url).path.value(), prefix);
  if (!path) {
    co_return GetTextResponse(404, "Not found");
  }
  FileDescriptor descriptor = co_await (*file_access)(
      std::move(path->file_id), GetQueryParameter(request.url, "token"),
      stop_token);
  file_access->CheckFileSize(descriptor);
  if (!path->filename) {
    co_return GetRedirectResponse(
        GetNamedLocation(request.url, prefix, descriptor));
  }
  auto range_header = http::GetHeader(request.headers, "Range");
  RangePlan plan = PlanRange(
      range_header ? std::make_optional<std::string_view>(*range_header)
                   : std::nullopt,
      descriptor.size);
  FileContentOptions options{
      .head_only = request.method == http::Method::kHead,
      .mobile = IsMobileUserAgent(
          http::GetHeader(request.headers, "User-Agent").value_or(""))};
  if (mode == Mode::kStream) {
    options.content_type = GetStreamingContentType(descriptor);
    options.content_disposition =
        GetContentDisposition("inline", descriptor.name);
  } else {
    options.content_type = "application/octet-stream";
    options.content_disposition =
        GetContentDisposition("attachment", descriptor.name);
  }
  co_return GetFileContentResponse(streamer, descriptor, plan,
                                   std::move(options), std::move(stop_token));
}

}  // namespace coro::filelink::util
