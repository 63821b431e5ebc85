#include "coro/filelink/util/direct_link_handler.h"

namespace coro::filelink::util {

auto DirectLinkHandler::operator()(Request request,
                                   stdx::stop_token stop_token) const
    -> Task<Response> {
  auto path = ParseFilePath(http::ParseUri(request.url).path.value(), "direct");
  if (!path) {
    co_return GetTextResponse(404, "Not found");
  }
  FileDescriptor descriptor = co_await (*file_access)(
      std::move(path->file_id), GetQueryParameter(request.url, "token"),
      std::move(stop_token));
  file_access->CheckFileSize(descriptor);
  co_return GetRedirectResponse(
      GetNamedLocation(request.url, "stream", descriptor));
}

}  // namespace coro::filelink::util
