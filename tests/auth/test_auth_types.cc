#include <gtest/gtest.h>

#include "hitl/auth/auth_types.h"

namespace hitl {
namespace auth {
namespace {

TEST(JoinScopesTest, SeparatesWithSingleSpaces) {
  EXPECT_EQ(joinScopes({"openid", "profile", "email"}), "openid profile email");
  EXPECT_EQ(joinScopes({"openid"}), "openid");
  EXPECT_EQ(joinScopes({}), "");
}

TEST(JoinScopesTest, SkipsEmptyEntries) {
  EXPECT_EQ(joinScopes({"", "openid", "", "email"}), "openid email");
  EXPECT_EQ(joinScopes({"", ""}), "");
}

TEST(ParseOAuthErrorTest, ReadsErrorAndDescription) {
  auto body = parseOAuthError(
      R"({"error":"invalid_grant","error_description":"expired"})");
  EXPECT_EQ(body.error, "invalid_grant");
  EXPECT_EQ(body.description, "expired");

  auto detail = parseOAuthError(R"({"detail":"Not authenticated"})");
  EXPECT_EQ(detail.error, "");
  EXPECT_EQ(detail.description, "Not authenticated");
}

TEST(ParseOAuthErrorTest, NonJsonBodyIsEmpty) {
  auto body = parseOAuthError("<html>Bad Gateway</html>");
  EXPECT_TRUE(body.error.empty());
  EXPECT_TRUE(body.description.empty());
  EXPECT_TRUE(parseOAuthError(R"(["invalid_grant"])").error.empty());
}

TEST(MaskSecretTest, KeepsOnlyShortPrefix) {
  EXPECT_EQ(maskSecret("abc"), "***");
  EXPECT_EQ(maskSecret("client-1234567890"), "clie...17 chars");
}

}  // namespace
}  // namespace auth
}  // namespace hitl
