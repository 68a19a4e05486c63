#include <gtest/gtest.h>
#include <chrono>
#include <ctime>
#include "deepseek/retry_policy.hpp"

using deepseek::TransportRetryConfig;
using deepseek::TransportRetryPolicy;

namespace {

std::chrono::system_clock::time_point utc(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace

class TransportRetryPolicyTest : public ::testing::Test {
protected:
    TransportRetryConfig config_;
};

TEST_F(TransportRetryPolicyTest, StatusBudget_AllowsThreeRetries) {
    TransportRetryPolicy policy(config_);

    EXPECT_TRUE(policy.increment_status(429));
    EXPECT_TRUE(policy.increment_status(429));
    EXPECT_TRUE(policy.increment_status(429));
    EXPECT_FALSE(policy.increment_status(429));
    EXPECT_TRUE(policy.is_exhausted());
    EXPECT_EQ(policy.attempts_failed(), 4);
}

TEST_F(TransportRetryPolicyTest, ConnectBudget_IsIndependentOfRead) {
    config_.total = 10;
    config_.connect = 1;
    TransportRetryPolicy policy(config_);

    EXPECT_TRUE(policy.increment_read_error("POST"));
    EXPECT_TRUE(policy.increment_connect_error());
    EXPECT_TRUE(policy.increment_read_error("POST"));
    EXPECT_FALSE(policy.increment_connect_error());
}

TEST_F(TransportRetryPolicyTest, TotalBudget_CapsAllClasses) {
    config_.total = 2;
    TransportRetryPolicy policy(config_);

    EXPECT_TRUE(policy.increment_connect_error());
    EXPECT_TRUE(policy.increment_read_error("POST"));
    EXPECT_FALSE(policy.increment_status(503));
}

TEST_F(TransportRetryPolicyTest, ReadError_OnMethodOutsideAllowedSetIsNotRetried) {
    TransportRetryPolicy policy(config_);

    EXPECT_FALSE(policy.is_method_retryable("GET"));
    EXPECT_FALSE(policy.increment_read_error("GET"));
}

TEST_F(TransportRetryPolicyTest, Backoff_FirstRetryIsImmediateThenDoubles) {
    TransportRetryPolicy policy(config_);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 0.0);

    policy.increment_status(503);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 0.0);
    policy.increment_status(503);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 4.0);
    policy.increment_status(503);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 8.0);
}

TEST_F(TransportRetryPolicyTest, Backoff_IsCappedAtMaximum) {
    config_.backoff_factor = 100.0;
    TransportRetryPolicy policy(config_);

    policy.increment_status(503);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 0.0);
    policy.increment_status(503);
    EXPECT_DOUBLE_EQ(policy.backoff_time().count(), 120.0);
}

TEST_F(TransportRetryPolicyTest, IsRetry_ForcedStatuses) {
    TransportRetryPolicy policy(config_);

    for (int status : {429, 500, 502, 503, 504}) {
        EXPECT_TRUE(policy.is_retry("POST", status, false)) << status;
    }
    EXPECT_FALSE(policy.is_retry("POST", 200, false));
    EXPECT_FALSE(policy.is_retry("POST", 400, false));
    EXPECT_FALSE(policy.is_retry("POST", 404, false));
    EXPECT_FALSE(policy.is_retry("GET", 503, false));
}

TEST_F(TransportRetryPolicyTest, IsRetry_PayloadTooLargeOnlyWithRetryAfter) {
    TransportRetryPolicy policy(config_);
    EXPECT_TRUE(policy.is_retry("POST", 413, true));
    EXPECT_FALSE(policy.is_retry("POST", 413, false));

    config_.respect_retry_after = false;
    TransportRetryPolicy ignoring(config_);
    EXPECT_FALSE(ignoring.is_retry("POST", 413, true));
}

TEST_F(TransportRetryPolicyTest, SleepTime_PrefersRetryAfter) {
    TransportRetryPolicy policy(config_);
    policy.increment_status(429);
    policy.increment_status(429);

    EXPECT_DOUBLE_EQ(policy.sleep_time(std::string("7")).count(), 7.0);
    EXPECT_DOUBLE_EQ(policy.sleep_time(std::nullopt).count(), 4.0);
    EXPECT_DOUBLE_EQ(policy.sleep_time(std::string("0")).count(), 4.0);
    EXPECT_DOUBLE_EQ(policy.sleep_time(std::string("soon")).count(), 4.0);

    config_.respect_retry_after = false;
    TransportRetryPolicy ignoring(config_);
    ignoring.increment_status(429);
    ignoring.increment_status(429);
    EXPECT_DOUBLE_EQ(ignoring.sleep_time(std::string("7")).count(), 4.0);
}

TEST(RetryAfterTest, ParsesDeltaSeconds) {
    auto parsed = TransportRetryPolicy::parse_retry_after(" 12 ");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->count(), 12.0);
}

TEST(RetryAfterTest, ParsesHttpDate) {
    auto now = utc(2015, 10, 21, 7, 27, 50);

    auto parsed = TransportRetryPolicy::parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT", now);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->count(), 10.0);
}

TEST(RetryAfterTest, PastDateIsZero) {
    auto now = utc(2015, 10, 21, 8, 0, 0);

    auto parsed = TransportRetryPolicy::parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT", now);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->count(), 0.0);
}

TEST(RetryAfterTest, RejectsGarbage) {
    EXPECT_FALSE(TransportRetryPolicy::parse_retry_after("").has_value());
    EXPECT_FALSE(TransportRetryPolicy::parse_retry_after("-5").has_value());
    EXPECT_FALSE(TransportRetryPolicy::parse_retry_after("tomorrow").has_value());
    EXPECT_FALSE(TransportRetryPolicy::parse_retry_after("Wed, 21 Oct 2015 07:28:00 PST").has_value());
}
