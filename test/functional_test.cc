#include <coro/http/http.h>
#include <coro/http/http_parse.h>
#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "coro/filelink/test/fake_file_link_context.h"
#include "coro/filelink/test/fake_http_client.h"
#include "coro/filelink/test/test_utils.h"

namespace coro::filelink::test {
namespace {

using ::coro::filelink::util::FileLinkConfig;

constexpr std::string_view kVideoMessage = R"js({
  "date": 1700000000,
  "video": {
    "file_id": "BAACAgIAAxkBAAI",
    "file_name": "clip.mp4",
    "file_size": 25000,
    "mime_type": "video/mp4"
  }
})js";

FileLinkConfig CreateConfig() {
  return FileLinkConfig{.host = "127.0.0.1",
                        .port = 0,
                        .base_url = "http://files.test",
                        .chunk_size = 1000,
                        .upstream_endpoint = "http://gateway",
                        .upstream_token = "bot-token",
                        .log_requests = false};
}

FakeHttpClient CreateGateway(std::string content) {
  FakeHttpClient http;
  http.Expect(HttpRequest("http://gateway/messages/-100123/42")
                  .WithHeader("Authorization", "Bearer bot-token")
                  .WillReturn(kVideoMessage))
      .Expect(HttpRequest([](std::string_view url) {
                return url.starts_with("http://gateway/files/BAACAgIAAxkBAAI?");
              })
                  .WithHeader("Authorization", "Bearer bot-token")
                  .WillServeBlocksOf(std::move(content)));
  return http;
}

std::string GetHeader(const ResponseContent& response, std::string_view name) {
  return http::GetHeader(response.headers, std::string(name)).value_or("");
}

TEST(FunctionalTest, ServesRange) {
  std::string content = MakeContent(25000);
  FakeFileLinkContext test_helper(CreateConfig(), CreateGateway(content));

  auto response =
      test_helper.Fetch({.url = "/stream/-100123_42/clip.mp4",
                         .headers = {{"Range", "bytes=1500-4499"}}});

  EXPECT_EQ(response.status, 206);
  EXPECT_EQ(GetHeader(response, "Content-Range"), "bytes 1500-4499/25000");
  EXPECT_EQ(GetHeader(response, "Content-Type"), "video/mp4");
  EXPECT_EQ(response.body, content.substr(1500, 3000));
}

TEST(FunctionalTest, ServesWholeFileAndReusesMetadata) {
  std::string content = MakeContent(25000);
  FakeFileLinkContext test_helper(CreateConfig(), CreateGateway(content));

  auto redirect = test_helper.Fetch({.url = "/download/-100123_42"});
  ASSERT_EQ(redirect.status, 302);
  EXPECT_EQ(GetHeader(redirect, "Location"), "/download/-100123_42/clip.mp4");

  auto response = test_helper.Fetch({.url = "/download/-100123_42/clip.mp4"});
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(GetHeader(response, "Content-Length"), "25000");
  EXPECT_EQ(response.body, content);
}

TEST(FunctionalTest, ReturnsFileInfo) {
  FakeFileLinkContext test_helper(CreateConfig(),
                                  CreateGateway(MakeContent(25000)));

  auto response = test_helper.Fetch({.url = "/info/-100123_42"});

  ASSERT_EQ(response.status, 200);
  auto json = nlohmann::json::parse(response.body);
  EXPECT_EQ(json.at("name"), "clip.mp4");
  EXPECT_EQ(json.at("size"), 25000);
  EXPECT_EQ(json.at("urls").at("direct"),
            "http://files.test/direct/-100123_42/clip.mp4");
}

TEST(FunctionalTest, UnknownFileIsNotFound) {
  FakeHttpClient http;
  http.Expect(HttpRequest("http://gateway/messages/1/2")
                  .WillReturn(ResponseContent{.status = 404}));
  FakeFileLinkContext test_helper(CreateConfig(), std::move(http));

  EXPECT_EQ(test_helper.Fetch({.url = "/stream/1_2/a.mp4"}).status, 404);
}

TEST(FunctionalTest, ReportsHealth) {
  FakeFileLinkContext test_helper(CreateConfig());

  auto response = test_helper.Fetch({.url = "/health"});

  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(nlohmann::json::parse(response.body).at("status"), "healthy");
}

TEST(FunctionalTest, FailsToStartOnBusyPort) {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t length = sizeof(address);
  ASSERT_EQ(bind(fd, reinterpret_cast<sockaddr*>(&address), length), 0);
  ASSERT_EQ(listen(fd, 1), 0);
  ASSERT_EQ(getsockname(fd, reinterpret_cast<sockaddr*>(&address), &length),
            0);

  FileLinkConfig config = CreateConfig();
  config.port = ntohs(address.sin_port);
  EXPECT_ANY_THROW(FakeFileLinkContext(std::move(config)));

  close(fd);
}

}  // namespace
}  // namespace coro::filelink::test
