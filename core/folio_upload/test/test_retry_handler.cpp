// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryHandler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>

#include "retry_handler.hpp"

using namespace folio::upload;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    RetryConfig config;
    config.max_retries = 4;
    config.initial_delay = std::chrono::milliseconds(500);
    config.max_delay = std::chrono::milliseconds(10000);
    config.exponential_base = 2.0;
    config.jitter = false;
    handler_ = std::make_unique<RetryHandler>(config);
  }

  std::unique_ptr<RetryHandler> handler_;
};

TEST_F(RetryHandlerTest, DelayDoublesPerRetry) {
  EXPECT_EQ(handler_->getDelay(0).count(), 500);
  EXPECT_EQ(handler_->getDelay(1).count(), 1000);
  EXPECT_EQ(handler_->getDelay(2).count(), 2000);
  EXPECT_EQ(handler_->getDelay(3).count(), 4000);
}

TEST_F(RetryHandlerTest, DelayIsCapped) {
  EXPECT_EQ(handler_->getDelay(5).count(), 10000);
  EXPECT_EQ(handler_->getDelay(30).count(), 10000);
}

TEST_F(RetryHandlerTest, RetriesUntilLimit) {
  EXPECT_TRUE(handler_->shouldRetry(0));
  EXPECT_TRUE(handler_->shouldRetry(3));
  EXPECT_FALSE(handler_->shouldRetry(4));
  EXPECT_EQ(handler_->maxRetries(), 4);
}

TEST_F(RetryHandlerTest, RetriesOnlyTransientUploadErrors) {
  UploadError transient{ErrorCode::PartUploadFailed, "timeout", "RequestTimeout", true};
  UploadError permanent{ErrorCode::PartUploadFailed, "denied", "AccessDenied", false};
  UploadError expired{ErrorCode::ExpiredSession, "gone", "NoSuchUpload", false};

  EXPECT_TRUE(handler_->shouldRetry(transient, 0));
  EXPECT_FALSE(handler_->shouldRetry(transient, 4));
  EXPECT_FALSE(handler_->shouldRetry(permanent, 0));
  EXPECT_FALSE(handler_->shouldRetry(expired, 0));
}

TEST_F(RetryHandlerTest, ZeroRetriesNeverRetries) {
  RetryConfig config;
  config.max_retries = 0;
  RetryHandler handler(config);
  EXPECT_FALSE(handler.shouldRetry(0));
}

TEST(RetryHandlerJitterTest, JitterStaysWithinFactor) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(1000);
  config.jitter = true;
  config.jitter_factor = 0.2;
  RetryHandler handler(config);

  std::set<int64_t> delays;
  for (int i = 0; i < 100; ++i) {
    auto delay = handler.getDelay(0).count();
    EXPECT_GE(delay, 800);
    EXPECT_LE(delay, 1200);
    delays.insert(delay);
  }
  EXPECT_GT(delays.size(), 1u);
}

TEST(RetryHandlerJitterTest, NeverBelowOneMillisecond) {
  RetryConfig config;
  config.initial_delay = std::chrono::milliseconds(0);
  config.jitter = false;
  RetryHandler handler(config);
  EXPECT_EQ(handler.getDelay(0).count(), 1);
}

TEST(RetryHandlerClassifyTest, TransientCodes) {
  for (const char* code : {"RequestTimeout", "ServiceUnavailable", "InternalError", "SlowDown",
                           "NetworkingError", "ConnectionReset", "XMinioServerNotInitialized"}) {
    EXPECT_TRUE(RetryHandler::isRetryableError(code)) << code;
  }
}

TEST(RetryHandlerClassifyTest, PermanentCodes) {
  for (const char* code :
       {"NoSuchUpload", "NoSuchKey", "NoSuchBucket", "AccessDenied", "InvalidPart", "EntityTooLarge",
        ""}) {
    EXPECT_FALSE(RetryHandler::isRetryableError(code)) << code;
  }
}

TEST(RetryHandlerClassifyTest, ThrottlingCodes) {
  for (const char* code : {"SlowDown", "Throttling", "ThrottlingException", "HTTP429"}) {
    EXPECT_EQ(RetryHandler::classify(code), RetryClass::Throttled) << code;
    EXPECT_TRUE(RetryHandler::isRetryableError(code)) << code;
  }
}

TEST(RetryHandlerClassifyTest, SynthesizedHttpStatusCodes) {
  EXPECT_EQ(RetryHandler::classify("HTTP500"), RetryClass::Transient);
  EXPECT_EQ(RetryHandler::classify("HTTP503"), RetryClass::Transient);
  EXPECT_EQ(RetryHandler::classify("HTTP403"), RetryClass::Permanent);
  EXPECT_EQ(RetryHandler::classify("HTTP404"), RetryClass::Permanent);
  EXPECT_EQ(RetryHandler::classify("HTTP5x0"), RetryClass::Permanent);
  EXPECT_EQ(RetryHandler::classify("HTTP5000"), RetryClass::Permanent);
}

TEST(RetryHandlerClassifyTest, SessionLifecycleErrorsArePermanent) {
  // Even when the backend code or flag would suggest otherwise
  for (ErrorCode code :
       {ErrorCode::KeyTooLong, ErrorCode::MalformedKey, ErrorCode::SessionNotFound,
        ErrorCode::ExpiredSession, ErrorCode::CapacityExceeded, ErrorCode::AlreadyCompleted,
        ErrorCode::InvalidArgument}) {
    UploadError error{code, "stop", "ServiceUnavailable", true};
    EXPECT_EQ(RetryHandler::classify(error), RetryClass::Permanent) << code;
  }
}

TEST(RetryHandlerClassifyTest, BackendErrorsUseCodeThenFlag) {
  UploadError throttled{ErrorCode::PartUploadFailed, "slow", "SlowDown", false};
  EXPECT_EQ(RetryHandler::classify(throttled), RetryClass::Throttled);

  UploadError flagged{ErrorCode::CompletionFailed, "reset", "HTTP0", true};
  EXPECT_EQ(RetryHandler::classify(flagged), RetryClass::Transient);

  UploadError denied{ErrorCode::BackendError, "denied", "AccessDenied", false};
  EXPECT_EQ(RetryHandler::classify(denied), RetryClass::Permanent);

  UploadError gone{ErrorCode::PartUploadFailed, "gone", "NoSuchUpload", false};
  EXPECT_EQ(RetryHandler::classify(gone), RetryClass::Permanent);
}

TEST_F(RetryHandlerTest, ThrottledErrorWaitsOneStepLonger) {
  UploadError throttled{ErrorCode::PartUploadFailed, "slow", "SlowDown", true};
  UploadError transient{ErrorCode::PartUploadFailed, "timeout", "RequestTimeout", true};

  EXPECT_EQ(handler_->getDelay(transient, 0).count(), 500);
  EXPECT_EQ(handler_->getDelay(throttled, 0).count(), 1000);
  EXPECT_EQ(handler_->getDelay(throttled, 2).count(), 4000);
  EXPECT_EQ(handler_->getDelay(throttled, 10).count(), 10000);
}

TEST(RetryClassTest, Names) {
  EXPECT_STREQ(retryClassName(RetryClass::Permanent), "Permanent");
  EXPECT_STREQ(retryClassName(RetryClass::Transient), "Transient");
  EXPECT_STREQ(retryClassName(RetryClass::Throttled), "Throttled");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
