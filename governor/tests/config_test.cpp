#include "config.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

json sample_document() {
    return json::parse(R"({
        "session_management": {
            "max_requests_per_session": 40,
            "max_session_duration": 1800,
            "session_renewal_jitter": 120,
            "cookie_persistence": false
        },
        "request_patterns": {
            "base_delay": 1.5,
            "max_delay": 6,
            "delay_jitter": 2,
            "max_requests_per_minute": 20,
            "max_requests_per_hour": 300,
            "burst_protection": true,
            "random_long_delays": {"enabled": true, "probability": 0.05, "min_delay": 30, "max_delay": 90}
        },
        "failure_handling": {
            "max_failed_requests": 8,
            "success_rate_threshold": 0.8,
            "retry_attempts": 2,
            "exponential_backoff": true,
            "window_seconds": 120,
            "circuit_breaker": {"enabled": true, "failure_threshold": 10, "recovery_timeout": 90}
        },
        "adaptive_security": {"threat_assessment": true, "min_samples": 20},
        "security_features": {
            "enable_proxy_rotation": true,
            "aggressive_mode": false,
            "stealth_mode": true
        },
        "emergency_protocols": {
            "ip_ban_detection": {"enabled": true, "indicators": ["Forbidden zone"], "response": "switch_proxy_and_delay"},
            "captcha_flood": {"enabled": true, "threshold": 4, "response": "long_delay_and_profile_change"},
            "rate_limit_detection": {"enabled": true, "respect_retry_after": true, "default_backoff": 30}
        },
        "site_specific": {
            "CraftPix.net": {"base_delay": 1, "max_requests_per_minute": 60, "aggressive_mode": true},
            "kenney.nl": {"request_patterns": {"max_delay": 10, "max_requests_per_hour": 200}, "requires_javascript": true}
        },
        "identity": {"profiles": [{"user_agent": "agent-one"}, {"user_agent": "agent-two"}]}
    })");
}

} // namespace

TEST(ConfigTest, ParsesGlobalPolicyFromSections) {
    Config config = Config::from_json(sample_document());
    const Policy& p = config.global_policy;

    EXPECT_EQ(p.max_requests_per_session, 40);
    EXPECT_EQ(p.max_session_duration, 30min);
    EXPECT_EQ(p.session_renewal_jitter, 2min);
    EXPECT_EQ(p.base_delay, 1500ms);
    EXPECT_EQ(p.max_delay, 6s);
    EXPECT_EQ(p.max_requests_per_minute, 20);
    EXPECT_EQ(p.max_requests_per_hour, 300);
    EXPECT_TRUE(p.random_long_delay.enabled);
    EXPECT_DOUBLE_EQ(p.random_long_delay.probability, 0.05);
    EXPECT_EQ(p.random_long_delay.max_delay, 90s);
    EXPECT_EQ(p.retry_attempts, 2);
    EXPECT_EQ(p.circuit_breaker.failure_threshold, 10);
    EXPECT_EQ(p.circuit_breaker.recovery_timeout, 90s);
    EXPECT_TRUE(p.stealth_mode);

    EXPECT_FALSE(config.cookie_persistence);
    EXPECT_EQ(config.failure_window, 2min);
    EXPECT_TRUE(config.threat_assessment);
    EXPECT_EQ(config.threat_min_samples, 20u);
    EXPECT_TRUE(config.security.enable_proxy_rotation);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, ParsesEmergencyProtocols) {
    Config config = Config::from_json(sample_document());

    ASSERT_EQ(config.emergency.ip_ban.indicators.size(), 1u);
    EXPECT_EQ(config.emergency.ip_ban.indicators[0], "Forbidden zone");
    EXPECT_EQ(config.emergency.captcha_flood.threshold, 4);
    EXPECT_EQ(config.emergency.captcha_flood.response, EmergencyAction::LongDelayAndProfileChange);
    EXPECT_EQ(config.emergency.rate_limit.default_backoff, 30s);
}

TEST(ConfigTest, SiteOverridesAcceptFlatAndSectionedKeys) {
    Config config = Config::from_json(sample_document());

    ASSERT_EQ(config.site_overrides.count("craftpix.net"), 1u);
    const PolicyOverride& craftpix = config.site_overrides.at("craftpix.net");
    EXPECT_EQ(craftpix.base_delay, Duration(1000));
    EXPECT_EQ(craftpix.max_requests_per_minute, 60);
    EXPECT_EQ(craftpix.aggressive_mode, true);
    EXPECT_FALSE(craftpix.max_delay.has_value());

    const PolicyOverride& kenney = config.site_overrides.at("kenney.nl");
    EXPECT_EQ(kenney.max_delay, Duration(10000));
    EXPECT_EQ(kenney.requires_javascript, true);
    EXPECT_EQ(kenney.max_requests_per_hour, 200);
}

TEST(ConfigTest, IdentityProfilesReplaceDefaultAgents) {
    Config config = Config::from_json(sample_document());
    ASSERT_EQ(config.user_agents.size(), 2u);
    EXPECT_EQ(config.user_agents[1], "agent-two");
}

TEST(ConfigTest, UnknownEmergencyResponseIsRejected) {
    json doc = sample_document();
    doc["emergency_protocols"]["ip_ban_detection"]["response"] = "panic";
    EXPECT_THROW(Config::from_json(doc), ConfigError);
}

TEST(ConfigTest, WrongValueTypeIsRejected) {
    json doc = sample_document();
    doc["request_patterns"]["base_delay"] = "slow";
    EXPECT_THROW(Config::from_json(doc), ConfigError);

    EXPECT_THROW(Config::from_json(json::array()), ConfigError);
}

TEST(ConfigTest, ValidateRejectsBrokenGlobalPolicy) {
    json doc = sample_document();
    doc["request_patterns"]["base_delay"] = 20;
    Config config = Config::from_json(doc);
    EXPECT_THROW(config.validate(), ConfigError);

    Config no_agents;
    no_agents.user_agents.clear();
    EXPECT_THROW(no_agents.validate(), ConfigError);

    Config bad_flood;
    bad_flood.emergency.captcha_flood.min_delay = 20min;
    EXPECT_THROW(bad_flood.validate(), ConfigError);

    Config no_samples;
    no_samples.threat_min_samples = 0;
    EXPECT_THROW(no_samples.validate(), ConfigError);

    json negative = sample_document();
    negative["failure_handling"]["circuit_breaker"]["recovery_timeout"] = -5;
    EXPECT_THROW(Config::from_json(negative).validate(), ConfigError);
}

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_TRUE(config.site_overrides.empty());
    EXPECT_EQ(config.emergency.ip_ban.response, EmergencyAction::SwitchProxyAndDelay);
}

TEST(ConfigTest, LoadFileReadsDocument) {
    std::string path = ::testing::TempDir() + "governor_config_test.json";
    {
        std::ofstream out(path);
        out << sample_document().dump(2);
    }

    Config config = Config::load_file(path);
    EXPECT_EQ(config.config_path, path);
    EXPECT_EQ(config.global_policy.max_requests_per_session, 40);
    std::remove(path.c_str());

    EXPECT_THROW(Config::load_file(path), ConfigError);
}

TEST(ConfigTest, EmergencyActionNames) {
    EXPECT_EQ(parse_emergency_action("backoff"), EmergencyAction::Backoff);
    EXPECT_STREQ(to_string(EmergencyAction::SwitchProxyAndDelay), "switch_proxy_and_delay");
    EXPECT_THROW(parse_emergency_action("Switch_Proxy"), ConfigError);
}
