#ifndef CORO_FILELINK_UTIL_FILE_INFO_HANDLER_H
#define CORO_FILELINK_UTIL_FILE_INFO_HANDLER_H

#include <nlohmann/json.hpp>
#include <string>

#include "coro/filelink/util/clock.h"
#include "coro/filelink/util/handler_utils.h"
#include "coro/filelink/util/link_token.h"
#include "coro/filelink/util/url_builder.h"
#include "coro/http/http.h"
#include "coro/stdx/stop_token.h"

namespace coro::filelink::util {

nlohmann::json ToJson(const FileDescriptor& descriptor,
                      const FileLinks& links);

// Describes /info/<file_id> as JSON, together with its public links.
struct FileInfoHandler {
  using Request = http::Request<>;
  using Response = http::Response<>;

  Task<Response> operator()(Request request, stdx::stop_token stop_token) const;

  const FileAccess* file_access;
  const LinkTokenPolicy* link_token_policy;
  const Clock* clock;
  std::string base_url;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_FILE_INFO_HANDLER_H
