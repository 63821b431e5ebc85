#include "coro/filelink/util/link_token.h"

#include <gtest/gtest.h>

namespace coro::filelink::util {
namespace {

TEST(LinkTokenTest, AllowAllPolicyIssuesNothingAndAcceptsEverything) {
  AllowAllLinkTokenPolicy policy;

  EXPECT_FALSE(policy.Issue("1_2", 1000));
  EXPECT_TRUE(policy.Verify("1_2", std::nullopt, 1000));
  EXPECT_TRUE(policy.Verify("1_2", "garbage", 1000));
}

TEST(LinkTokenTest, IssuedTokenVerifies) {
  HmacLinkTokenPolicy policy("secret", /*ttl=*/3600);

  std::optional<std::string> token = policy.Issue("1_2", 1000);

  ASSERT_TRUE(token);
  EXPECT_TRUE(token->starts_with("4600:"));
  EXPECT_EQ(token->size(), std::string("4600:").size() + 16);
  EXPECT_TRUE(policy.Verify("1_2", *token, 1000));
  EXPECT_TRUE(policy.Verify("1_2", *token, 4599));
}

TEST(LinkTokenTest, IsDeterministic) {
  HmacLinkTokenPolicy policy("secret", 3600);

  EXPECT_EQ(policy.Issue("1_2", 1000), policy.Issue("1_2", 1000));
  EXPECT_NE(policy.Issue("1_2", 1000), policy.Issue("1_3", 1000));
}

TEST(LinkTokenTest, RejectsExpiredToken) {
  HmacLinkTokenPolicy policy("secret", 3600);
  std::string token = *policy.Issue("1_2", 1000);

  EXPECT_FALSE(policy.Verify("1_2", token, 4600));
  EXPECT_FALSE(policy.Verify("1_2", token, 10000));
}

TEST(LinkTokenTest, RejectsTokenOfOtherFile) {
  HmacLinkTokenPolicy policy("secret", 3600);

  EXPECT_FALSE(policy.Verify("1_3", *policy.Issue("1_2", 1000), 1000));
}

TEST(LinkTokenTest, RejectsTokenSignedWithOtherSecret) {
  HmacLinkTokenPolicy policy("secret", 3600);
  HmacLinkTokenPolicy other("other secret", 3600);

  EXPECT_FALSE(policy.Verify("1_2", *other.Issue("1_2", 1000), 1000));
}

TEST(LinkTokenTest, RejectsExtendedExpiry) {
  HmacLinkTokenPolicy policy("secret", 3600);
  std::string token = *policy.Issue("1_2", 1000);
  std::string forged = "9999" + token.substr(token.find(':'));

  EXPECT_FALSE(policy.Verify("1_2", forged, 5000));
}

TEST(LinkTokenTest, RejectsMalformedToken) {
  HmacLinkTokenPolicy policy("secret", 3600);

  EXPECT_FALSE(policy.Verify("1_2", std::nullopt, 1000));
  for (const char* token : {"", ":", "4600", "4600:", "abc:0123456789abcdef",
                            "4600:zz", "-1:0123456789abcdef"}) {
    EXPECT_FALSE(policy.Verify("1_2", token, 1000)) << token;
  }
}

}  // namespace
}  // namespace coro::filelink::util
