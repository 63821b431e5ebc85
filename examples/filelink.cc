#include <fmt/format.h>

#include <csignal>
#include <iostream>

#include "coro/filelink/util/file_link_config.h"
#include "coro/filelink/util/file_link_context.h"
#include "coro/filelink/util/file_link_handler.h"
#include "coro/http/curl_http.h"
#include "coro/util/event_loop.h"

using ::coro::Promise;
using ::coro::Task;
using ::coro::filelink::util::FileLinkConfig;
using ::coro::filelink::util::FileLinkContext;
using ::coro::filelink::util::FileLinkHandler;
using ::coro::filelink::util::GetBaseUrl;
using ::coro::filelink::util::GetEnvironmentVariable;
using ::coro::filelink::util::LoadFileLinkConfig;
using ::coro::http::CurlHttp;
using ::coro::util::EventLoop;

EventLoop gEventLoop;
Promise<void> gQuit;

class HttpHandler {
 public:
  using Request = coro::http::Request<>;
  using Response = coro::http::Response<>;

  HttpHandler(FileLinkHandler file_link_handler, bool log_requests)
      : file_link_handler_(std::move(file_link_handler)),
        log_requests_(log_requests) {}

  Task<Response> operator()(Request request,
                            coro::stdx::stop_token stop_token) {
    std::string line;
    if (log_requests_) {
      line = fmt::format("{} {}", coro::http::MethodToString(request.method),
                         request.url);
      if (auto range_str = coro::http::GetHeader(request.headers, "Range")) {
        line += fmt::format(" {}", *range_str);
      }
    }
    auto response = co_await file_link_handler_(std::move(request),
                                                std::move(stop_token));
    if (log_requests_) {
      std::cerr << line << " " << response.status << "\n";
    }
    co_return response;
  }

 private:
  FileLinkHandler file_link_handler_;
  bool log_requests_;
};

Task<> CoMain(FileLinkContext* context, Promise<void>* quit) {
  try {
    auto http_server = context->CreateHttpServer(HttpHandler(
        context->CreateFileLinkHandler(), context->config().log_requests));
    std::cerr << fmt::format("LISTENING {}:{} BASE URL {}\n",
                             context->config().host, http_server.GetPort(),
                             GetBaseUrl(context->config()));
    co_await *quit;
    co_await http_server.Quit();
  } catch (const std::exception& exception) {
    std::cerr << "EXCEPTION: " << exception.what() << "\n";
  }
}

void SignalHandler(int signal) {
  gEventLoop.RunOnEventLoop([] { gQuit.SetValue(); });
}

int main(int argc, char** argv) {
#ifdef SIGPIPE
  signal(SIGPIPE, SIG_IGN);  // NOLINT
#endif

  signal(SIGTERM, SignalHandler);
  signal(SIGINT, SignalHandler);

  std::optional<std::string> config_path =
      argc > 1 ? std::make_optional<std::string>(argv[1])
               : GetEnvironmentVariable("FILELINK_CONFIG");
  FileLinkConfig config;
  try {
    config = LoadFileLinkConfig(std::move(config_path));
  } catch (const std::exception& exception) {
    std::cerr << "CONFIG ERROR: " << exception.what() << "\n";
    return 1;
  }

  FileLinkContext context(&gEventLoop, std::move(config),
                          coro::http::Http(CurlHttp(&gEventLoop)));
  coro::RunTask(CoMain(&context, &gQuit));
  gEventLoop.EnterLoop();
  return 0;
}
