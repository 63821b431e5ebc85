#include "coro/filelink/test/fake_file_link_context.h"

#include <coro/http/http_parse.h>
#include <gtest/gtest.h>

#include <exception>

#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::test {

namespace {

using ::coro::filelink::util::FileLinkConfig;
using ::coro::filelink::util::StrCat;
using ::coro::http::GetBody;

}  // namespace

FakeFileLinkContext::FakeFileLinkContext(FileLinkConfig config,
                                         FakeHttpClient http)
    : thread_([this, config = std::move(config),
               http = std::move(http)]() mutable {
        RunThread(std::move(config), std::move(http));
      }) {
  try {
    ready_.get_future().get();
  } catch (...) {
    thread_.join();
    throw;
  }
}

FakeFileLinkContext::~FakeFileLinkContext() {
  state_->event_loop().RunOnEventLoop([&] { state_->quit().SetValue(); });
  thread_.join();
  if (exception_) {
    try {
      std::rethrow_exception(exception_);
    } catch (const std::exception& e) {
      ADD_FAILURE() << "server thread failed: " << e.what();
    }
  }
}

ResponseContent FakeFileLinkContext::Fetch(
    http::Request<std::string> request) {
  request.url = StrCat(*address_, request.url);
  return state_->event_loop().Do(
      [this, request = std::move(request)]() mutable -> Task<ResponseContent> {
        auto response = co_await state_->http().Fetch(std::move(request));
        auto body = co_await GetBody(std::move(response.body));
        co_return ResponseContent{.status = response.status,
                                  .headers = std::move(response.headers),
                                  .body = std::move(body)};
      });
}

void FakeFileLinkContext::RunThread(FileLinkConfig config,
                                    FakeHttpClient http) {
  state_.emplace(std::move(config), std::move(http));
  bool started = false;
  RunTask([&]() -> Task<> {
    try {
      auto http_server = state_->context().CreateHttpServer(
          state_->context().CreateFileLinkHandler());
      address_ = "http://127.0.0.1:" + std::to_string(http_server.GetPort());
      started = true;
      ready_.set_value();
      co_await state_->quit();
      co_await http_server.Quit();
    } catch (...) {
      if (started) {
        exception_ = std::current_exception();
      } else {
        ready_.set_exception(std::current_exception());
      }
    }
  });
  if (started) {
    state_->event_loop().EnterLoop();
  }
}

FakeFileLinkContext::ThreadState::ThreadState(FileLinkConfig config,
                                              FakeHttpClient http)
    : context_(&event_loop_, std::move(config),
               coro::http::Http(std::move(http))) {}

}  // namespace coro::filelink::test
