#include "coro/filelink/util/url_builder.h"

#include "coro/filelink/util/media_utils.h"
#include "coro/filelink/util/string_utils.h"
#include "coro/http/http_parse.h"

namespace coro::filelink::util {

FileLinks BuildUrls(std::string_view file_id, std::string_view filename,
                    std::string_view base_url,
                    std::optional<std::string_view> token) {
  while (base_url.ends_with('/')) {
    base_url.remove_suffix(1);
  }
  std::string encoded_filename = http::EncodeUri(GenerateSafeFilename(filename));
  std::string query =
      token ? StrCat("?", http::FormDataToString({{"token", std::string(*token)}}))
            : "";
  auto url = [&](std::string_view prefix, std::string_view suffix = "") {
    return StrCat(base_url, "/", prefix, "/", file_id, suffix, query);
  };
  std::string named_suffix = StrCat("/", encoded_filename);
  return FileLinks{.download = url("download"),
                   .download_named = url("download", named_suffix),
                   .stream = url("stream"),
                   .stream_named = url("stream", named_suffix),
                   .direct = url("direct", named_suffix),
                   .info = url("info")};
}

}  // namespace coro::filelink::util
