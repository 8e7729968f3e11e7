#include <gtest/gtest.h>

#include <set>
#include <string>

#include "hitl/core/error.h"

namespace hitl {
namespace {

TEST(ErrorTest, CodeNamesAreDistinct) {
  const ErrorCode codes[] = {
      ErrorCode::REGISTRATION_ERROR,   ErrorCode::AUTHORIZATION_DENIED,
      ErrorCode::AUTHORIZATION_TIMEOUT, ErrorCode::STATE_MISMATCH,
      ErrorCode::TOKEN_EXCHANGE_ERROR, ErrorCode::TOKEN_REFRESH_ERROR,
      ErrorCode::REAUTHENTICATION_REQUIRED, ErrorCode::ENCRYPTION_ERROR,
      ErrorCode::DECRYPTION_ERROR,     ErrorCode::NETWORK_ERROR,
      ErrorCode::PERMISSION_ERROR,     ErrorCode::CANCELLED,
      ErrorCode::CONFIGURATION_ERROR};

  std::set<std::string> names;
  for (ErrorCode code : codes) {
    std::string name = errorCodeToString(code);
    EXPECT_NE(name, "UnknownError");
    names.insert(name);
  }
  EXPECT_EQ(names.size(), sizeof(codes) / sizeof(codes[0]));
  EXPECT_STREQ(errorCodeToString(ErrorCode::REAUTHENTICATION_REQUIRED),
               "ReauthenticationRequired");
  EXPECT_STREQ(errorCodeToString(static_cast<ErrorCode>(1)), "UnknownError");
}

TEST(ErrorTest, CarriesMessageAndCode) {
  HitlError error(ErrorCode::STATE_MISMATCH, "state does not match");
  EXPECT_EQ(error.code(), ErrorCode::STATE_MISMATCH);
  EXPECT_STREQ(error.what(), "state does not match");
  EXPECT_TRUE(error.oauthError().empty());
  EXPECT_FALSE(error.isInvalidClient());
}

TEST(ErrorTest, InvalidClientDetection) {
  EXPECT_TRUE(HitlError(ErrorCode::TOKEN_EXCHANGE_ERROR, "x", "invalid_client")
                  .isInvalidClient());
  EXPECT_TRUE(HitlError(ErrorCode::TOKEN_REFRESH_ERROR, "x",
                        "unauthorized_client")
                  .isInvalidClient());
  EXPECT_FALSE(HitlError(ErrorCode::TOKEN_REFRESH_ERROR, "x", "invalid_grant")
                   .isInvalidClient());
}

TEST(ErrorTest, CatchableAsRuntimeError) {
  try {
    throw HitlError(ErrorCode::NETWORK_ERROR, "connection refused");
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "connection refused");
  }
}

}  // namespace
}  // namespace hitl
