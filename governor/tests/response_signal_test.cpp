#include "response_signal.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(ResponseSignalTest, RetryAfterHeaderIsCaseInsensitive) {
    auto signal = ResponseSignal::from_http(429, {{"RETRY-AFTER", " 120 "}}, "");
    ASSERT_TRUE(signal.retry_after.has_value());
    EXPECT_EQ(*signal.retry_after, 120s);
}

TEST(ResponseSignalTest, HttpDateRetryAfterIsIgnored) {
    auto signal = ResponseSignal::from_http(429, {{"Retry-After", "Wed, 21 Oct 2026 07:28:00 GMT"}}, "");
    EXPECT_FALSE(signal.retry_after.has_value());

    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("-5").has_value());
    EXPECT_FALSE(parse_retry_after("99999999999999999999999").has_value());
    EXPECT_EQ(parse_retry_after("0").value_or(Duration(-1)), Duration(0));
}

TEST(ResponseSignalTest, BodyIsTruncatedToExcerpt) {
    std::string body(ResponseSignal::kMaxExcerpt + 100, 'x');
    auto signal = ResponseSignal::from_http(200, {}, body);
    EXPECT_EQ(signal.body_excerpt.size(), ResponseSignal::kMaxExcerpt);
    EXPECT_FALSE(signal.captcha_challenge);
}

TEST(ResponseSignalTest, StatusClassification) {
    EXPECT_TRUE(ResponseSignal::from_http(200, {}, "").ok());
    EXPECT_TRUE(ResponseSignal::from_http(301, {}, "").ok());
    EXPECT_FALSE(ResponseSignal::from_http(404, {}, "").ok());
    EXPECT_FALSE(ResponseSignal::from_http(503, {}, "").ok());

    auto lost = ResponseSignal::transport_error();
    EXPECT_EQ(lost.status, 0);
    EXPECT_FALSE(lost.ok());
}
