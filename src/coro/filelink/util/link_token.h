#ifndef CORO_FILELINK_UTIL_LINK_TOKEN_H
#define CORO_FILELINK_UTIL_LINK_TOKEN_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace coro::filelink::util {

// Decides whether a public link may be served. Links built by BuildUrls carry
// the issued token in the `token` query parameter.
class LinkTokenPolicy {
 public:
  virtual ~LinkTokenPolicy() = default;

  // Token to attach to new links for `file_id`, nullopt if links are not
  // signed.
  virtual std::optional<std::string> Issue(std::string_view file_id,
                                           int64_t now) const = 0;

  virtual bool Verify(std::string_view file_id,
                      std::optional<std::string_view> token,
                      int64_t now) const = 0;
};

class AllowAllLinkTokenPolicy : public LinkTokenPolicy {
 public:
  std::optional<std::string> Issue(std::string_view file_id,
                                   int64_t now) const override {
    return std::nullopt;
  }

  bool Verify(std::string_view file_id, std::optional<std::string_view> token,
              int64_t now) const override {
    return true;
  }
};

// Tokens have the form "<expiry>:<signature>", the signature being the first
// 16 hex digits of HMAC-SHA256(secret, "<file_id>:<expiry>").
class HmacLinkTokenPolicy : public LinkTokenPolicy {
 public:
  HmacLinkTokenPolicy(std::string secret, int64_t ttl)
      : secret_(std::move(secret)), ttl_(ttl) {}

  std::optional<std::string> Issue(std::string_view file_id,
                                   int64_t now) const override;
  bool Verify(std::string_view file_id, std::optional<std::string_view> token,
              int64_t now) const override;

 private:
  std::string GetSignature(std::string_view file_id, int64_t expiry) const;

  std::string secret_;
  int64_t ttl_;
};

}  // namespace coro::filelink::util

#endif  // CORO_FILELINK_UTIL_LINK_TOKEN_H
