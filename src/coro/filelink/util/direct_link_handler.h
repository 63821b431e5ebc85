#ifndef CORO_FILELINK_UTIL_DIRECT_LINK_HANDLER_H
#define CORO_FILELINK_UTIL_DIRECT_LINK_HANDLER_H

#include "coro/filelink/util/handler_utils.h"
#include "coro/http/http.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

// Redirects /direct/<file_id>/<filename> to the named stream path.
struct DirectLinkHandler {
  using Request = http::Request<>;
  using Response = http::Response<>;

  Task<Response> operator()(Request request, stdx::stop_token stop_token) const;

  const FileAccess* file_access;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_DIRECT_LINK_HANDLER_H
