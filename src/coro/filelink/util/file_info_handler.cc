#include "coro/filelink/util/file_info_handler.h"

#include "coro/filelink/util/media_utils.h"
#include "coro/filelink/util/url_builder.h"

namespace coro::filelink::util {

nlohmann::json ToJson(const FileDescriptor& descriptor,
                      const FileLinks& links) {
  nlohmann::json json;
  json["file_id"] = descriptor.file_id;
  json["name"] = descriptor.name;
  json["size"] = descriptor.size;
  json["size_formatted"] = FormatFileSize(descriptor.size);
  json["mime_type"] = descriptor.mime_type;
  json["category"] = ToString(descriptor.category);
  json["streamable"] = descriptor.streamable;
  if (descriptor.duration) {
    json["duration"] = *descriptor.duration;
  }
  if (descriptor.width) {
    json["width"] = *descriptor.width;
  }
  if (descriptor.height) {
    json["height"] = *descriptor.height;
  }
  if (descriptor.performer) {
    json["performer"] = *descriptor.performer;
  }
  if (descriptor.title) {
    json["title"] = *descriptor.title;
  }
  if (descriptor.date) {
    json["date"] = *descriptor.date;
  }
  json["urls"] = {{"download", links.download},
                  {"download_named", links.download_named},
                  {"stream", links.stream},
                  {"stream_named", links.stream_named},
                  {"direct", links.direct},
                  {"info", links.info}};
  return json;
}

auto FileInfoHandler::operator()(Request request,
                                 stdx::stop_token stop_token) const
    -> Task<Response> {
  auto path = ParseFilePath(http::ParseUri(request.url).path.value(), "info");
  if (!path) {
    co_return GetTextResponse(404, "Not found");
  }
  FileDescriptor descriptor = co_await (*file_access)(
      std::move(path->file_id), GetQueryParameter(request.url, "token"),
      std::move(stop_token));
  auto token = link_token_policy->Issue(descriptor.file_id, clock->Now());
  std::string content =
      ToJson(descriptor,
             BuildUrls(descriptor.file_id, descriptor.name, base_url,
                       token ? std::make_optional<std::string_view>(*token)
                             : std::nullopt))
          .dump();
  co_return Response{
      .status = 200,
      .headers = {{"Content-Type", "application/json"},
                  {"Content-Length", std::to_string(content.size())},
                  {"Access-Control-Allow-Origin", "*"}},
      .body = http::CreateBody(std::move(content))};
}

}  // namespace coro::filelink::util
