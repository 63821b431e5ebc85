#include "coro/filelink/util/health_handler.h"

#include <nlohmann/json.hpp>

namespace coro::filelink::util {

auto HealthHandler::operator()(Request request,
                               stdx::stop_token stop_token) const
    -> Task<Response> {
  nlohmann::json json;
  json["status"] = "healthy";
  json["service"] = "coro-filelink";
  std::string content = json.dump();
  co_return Response{
      .status = 200,
      .headers = {{"Content-Type", "application/json"},
                  {"Content-Length", std::to_string(content.size())},
                  {"Access-Control-Allow-Origin", "*"}},
      .body = http::CreateBody(std::move(content))};
}

}  // namespace coro::filelink::util
