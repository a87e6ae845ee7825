#include "ban_detector.hpp"
#include "config.hpp"
#include "failure_monitor.hpp"
#include "pacing_engine.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

ResponseSignal signal_of(int status, const std::string& body = "",
                         std::map<std::string, std::string> headers = {}) {
    return ResponseSignal::from_http(status, headers, body);
}

ResponseSignal captcha_page() {
    return signal_of(200, "<div class=\"g-recaptcha\"></div>");
}

} // namespace

class BanDetectorTest : public ::testing::Test {
protected:
    BanDetectorTest()
        : pacing_(config_, random_, clock_),
          monitor_(config_, pacing_, clock_),
          detector_(config_, monitor_, random_, clock_) {}

    Config config_;
    ScriptedRandom random_;
    ManualClock clock_;
    PacingEngine pacing_;
    FailureMonitor monitor_;
    BanDetector detector_;
    Policy policy_;
};

TEST_F(BanDetectorTest, ForbiddenWithAccessDeniedIsIpBan) {
    auto event = detector_.inspect("kenney.nl", signal_of(403, "Access denied"), policy_);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::IPBan);
    EXPECT_EQ(event->action, EmergencyAction::SwitchProxyAndDelay);
    EXPECT_EQ(event->forced_delay, policy_.circuit_breaker.recovery_timeout);
    EXPECT_EQ(event->domain, "kenney.nl");
}

TEST_F(BanDetectorTest, IpBanWinsOverCaptchaFlood) {
    detector_.inspect("kenney.nl", captcha_page(), policy_);
    detector_.inspect("kenney.nl", captcha_page(), policy_);

    ResponseSignal blocked = signal_of(403, "Access denied");
    blocked.captcha_challenge = true;
    auto event = detector_.inspect("kenney.nl", blocked, policy_);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::IPBan);
    // The sighting was still counted
    EXPECT_EQ(monitor_.record_captcha("kenney.nl"), 4);
}

TEST_F(BanDetectorTest, BodyIndicatorMatchesCaseInsensitively) {
    auto event = detector_.inspect("kenney.nl", signal_of(200, "we detected UNUSUAL TRAFFIC from you"), policy_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::IPBan);
}

TEST_F(BanDetectorTest, CaptchaFloodFiresAtThreshold) {
    EXPECT_FALSE(detector_.inspect("kenney.nl", captcha_page(), policy_).has_value());
    EXPECT_FALSE(detector_.inspect("kenney.nl", captcha_page(), policy_).has_value());

    random_.push_fraction(0.5);
    auto event = detector_.inspect("kenney.nl", captcha_page(), policy_);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::CaptchaFlood);
    EXPECT_EQ(event->action, EmergencyAction::LongDelayAndProfileChange);
    EXPECT_EQ(event->forced_delay, 10min);
}

TEST_F(BanDetectorTest, CaptchaSightingsOutsideWindowDoNotCount) {
    detector_.inspect("kenney.nl", captcha_page(), policy_);
    detector_.inspect("kenney.nl", captcha_page(), policy_);

    clock_.advance(config_.failure_window + 1s);
    EXPECT_FALSE(detector_.inspect("kenney.nl", captcha_page(), policy_).has_value());
}

TEST_F(BanDetectorTest, RetryAfterSetsExactForcedDelay) {
    auto event = detector_.inspect("kenney.nl", signal_of(429, "", {{"Retry-After", "45"}}), policy_);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::RateLimited);
    EXPECT_EQ(event->action, EmergencyAction::Backoff);
    EXPECT_EQ(event->forced_delay, 45s);
}

TEST_F(BanDetectorTest, RateLimitWithoutRetryAfterUsesDefaultBackoff) {
    auto event = detector_.inspect("kenney.nl", signal_of(429), policy_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->forced_delay, config_.emergency.rate_limit.default_backoff);

    config_.emergency.rate_limit.respect_retry_after = false;
    event = detector_.inspect("kenney.nl", signal_of(429, "", {{"retry-after", "45"}}), policy_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->forced_delay, 60s);
}

TEST_F(BanDetectorTest, TooManyRequestsIsIpBanWhenRateLimitDetectionOff) {
    config_.emergency.rate_limit.enabled = false;
    auto event = detector_.inspect("kenney.nl", signal_of(429), policy_);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EmergencyKind::IPBan);
}

TEST_F(BanDetectorTest, OrdinaryResponsesRaiseNothing) {
    EXPECT_FALSE(detector_.inspect("kenney.nl", signal_of(200, "<html>assets</html>"), policy_).has_value());
    EXPECT_FALSE(detector_.inspect("kenney.nl", signal_of(500, "oops"), policy_).has_value());
    EXPECT_FALSE(detector_.inspect("kenney.nl", ResponseSignal::transport_error(), policy_).has_value());
}

TEST_F(BanDetectorTest, DisabledProtocolsAreSkipped) {
    config_.emergency.ip_ban.enabled = false;
    EXPECT_FALSE(detector_.inspect("kenney.nl", signal_of(403, "Access denied"), policy_).has_value());
}

TEST_F(BanDetectorTest, SightingsRaiseThreatLevel) {
    for (int i = 0; i < 10; ++i) {
        monitor_.report("kenney.nl", Outcome{true, 1}, policy_);
    }
    detector_.inspect("kenney.nl", signal_of(200, "<html>fine</html>"), policy_);
    EXPECT_EQ(monitor_.threat_level("kenney.nl"), ThreatLevel::Low);

    for (int i = 0; i < 4; ++i) {
        detector_.inspect("kenney.nl", signal_of(403, "Access denied"), policy_);
    }
    EXPECT_EQ(monitor_.threat_level("kenney.nl"), ThreatLevel::High);
}
