#ifndef CORO_FILELINK_UTIL_HEALTH_HANDLER_H
#define CORO_FILELINK_UTIL_HEALTH_HANDLER_H

#include "coro/http/http.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

struct HealthHandler {
  using Request = http::Request<>;
  using Response = http::Response<>;

  Task<Response> operator()(Request request, stdx::stop_token stop_token) const;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_HEALTH_HANDLER_H
