#include "coro/filelink/util/link_token.h"

#include <fmt/format.h>

#include "coro/filelink/util/crypto_utils.h"
#include "coro/filelink/util/string_utils.h"

namespace coro::filelink::util {

namespace {

constexpr size_t kSignatureLength = 16;

}  // namespace

std::optional<std::string> HmacLinkTokenPolicy::Issue(std::string_view file_id,
                                                      int64_t now) const {
  int64_t expiry = now + ttl_;
  return fmt::format("{}:{}", expiry, GetSignature(file_id, expiry));
}

bool HmacLinkTokenPolicy::Verify(std::string_view file_id,
                                 std::optional<std::string_view> token,
                                 int64_t now) const {
  if (!token) {
    return false;
  }
  auto separator = token->find(':');
  if (separator == std::string_view::npos) {
    return false;
  }
  auto expiry = ParseInt64(token->substr(0, separator));
  if (!expiry || *expiry <= now) {
    return false;
  }
  return ConstantTimeEqual(token->substr(separator + 1),
                           GetSignature(file_id, *expiry));
}

std::string HmacLinkTokenPolicy::GetSignature(std::string_view file_id,
                                              int64_t expiry) const {
  return ToHex(GetHMACSHA256(secret_, fmt::format("{}:{}", file_id, expiry)))
      .substr(0, kSignatureLength);
}

}  // namespace coro::filelink::util
