#ifndef CORO_FILELINK_TEST_FAKE_FILE_LINK_CONTEXT_H
#define CORO_FILELINK_TEST_FAKE_FILE_LINK_CONTEXT_H

#include <coro/http/curl_http.h>
#include <coro/http/http.h>
#include <coro/promise.h>
#include <coro/util/event_loop.h>

#include <exception>
#include <future>
#include <optional>
#include <string>
#include <thread>

#include "coro/filelink/test/fake_http_client.h"
#include "coro/filelink/util/file_link_config.h"
#include "coro/filelink/util/file_link_context.h"

namespace coro::filelink::test {

// Runs the real server on 127.0.0.1 on its own event loop thread, backed by
// `http` as the upstream gateway.
class FakeFileLinkContext {
 public:
  // Throws if the server fails to start.
  explicit FakeFileLinkContext(util::FileLinkConfig config,
                               FakeHttpClient http = {});
  FakeFileLinkContext(const FakeFileLinkContext&) = delete;
  FakeFileLinkContext(FakeFileLinkContext&&) = delete;
  FakeFileLinkContext& operator=(const FakeFileLinkContext&) = delete;
  FakeFileLinkContext& operator=(FakeFileLinkContext&&) = delete;
  ~FakeFileLinkContext();

  // Sends `request` to the server. Redirects are not followed.
  ResponseContent Fetch(http::Request<std::string> request);

 private:
  void RunThread(util::FileLinkConfig config, FakeHttpClient http);

  class ThreadState {
   public:
    ThreadState(util::FileLinkConfig config, FakeHttpClient http);

    coro::util::EventLoop& event_loop() { return event_loop_; }
    coro::http::Http& http() { return http_; }
    util::FileLinkContext& context() { return context_; }
    Promise<void>& quit() { return quit_; }

   private:
    coro::util::EventLoop event_loop_;
    coro::http::Http http_{coro::http::CurlHttp{&event_loop_}};
    util::FileLinkContext context_;
    Promise<void> quit_;
  };
  std::optional<ThreadState> state_;
  std::promise<void> ready_;
  std::optional<std::string> address_;
  std::exception_ptr exception_;
  std::thread thread_;
};

}  // namespace coro::filelink::test

#endif  // CORO_FILELINK_TEST_FAKE_FILE_LINK_CONTEXT_H
