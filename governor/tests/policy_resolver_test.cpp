#include "config.hpp"
#include "errors.hpp"
#include "policy_resolver.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace {

Config config_with_sites() {
    Config config;

    PolicyOverride craftpix;
    craftpix.base_delay = Duration(1000);
    craftpix.max_requests_per_minute = 60;
    craftpix.aggressive_mode = true;
    config.site_overrides["craftpix.net"] = craftpix;

    PolicyOverride kenney;
    kenney.max_requests_per_session = 20;
    kenney.requires_javascript = true;
    config.site_overrides["kenney.nl"] = kenney;

    return config;
}

} // namespace

TEST(PolicyResolverTest, UnknownDomainGetsGlobalDefault) {
    Config config = config_with_sites();
    PolicyResolver resolver(config);

    Policy policy = resolver.resolve("opengameart.org");
    EXPECT_EQ(policy.max_requests_per_session, 50);
    EXPECT_EQ(policy.base_delay, Duration(2000));
    EXPECT_EQ(policy.max_delay, Duration(8000));
    EXPECT_TRUE(policy.stealth_mode);
    EXPECT_FALSE(policy.aggressive_mode);
    EXPECT_FALSE(resolver.has_override("opengameart.org"));
}

TEST(PolicyResolverTest, OverrideInheritsUnspecifiedFields) {
    Config config = config_with_sites();
    PolicyResolver resolver(config);

    Policy policy = resolver.resolve("craftpix.net");
    EXPECT_EQ(policy.base_delay, Duration(1000));
    EXPECT_EQ(policy.max_requests_per_minute, 60);
    EXPECT_EQ(policy.max_delay, Duration(8000));
    EXPECT_EQ(policy.delay_jitter, Duration(3000));
    EXPECT_EQ(policy.retry_attempts, 3);
    EXPECT_EQ(policy.circuit_breaker.recovery_timeout, Duration(60000));
}

TEST(PolicyResolverTest, WwwPrefixAndCaseFindOverride) {
    Config config = config_with_sites();
    PolicyResolver resolver(config);

    EXPECT_TRUE(resolver.has_override("www.kenney.nl"));
    EXPECT_TRUE(resolver.has_override("Kenney.NL"));

    Policy policy = resolver.resolve("WWW.Kenney.nl");
    EXPECT_EQ(policy.max_requests_per_session, 20);
    EXPECT_TRUE(policy.requires_javascript);
}

TEST(PolicyResolverTest, ResolveIsIdempotent) {
    Config config = config_with_sites();
    PolicyResolver resolver(config);

    Policy first = resolver.resolve("craftpix.net");
    Policy second = resolver.resolve("craftpix.net");

    EXPECT_EQ(first.max_requests_per_session, second.max_requests_per_session);
    EXPECT_EQ(first.max_session_duration, second.max_session_duration);
    EXPECT_EQ(first.base_delay, second.base_delay);
    EXPECT_EQ(first.max_delay, second.max_delay);
    EXPECT_EQ(first.delay_jitter, second.delay_jitter);
    EXPECT_EQ(first.max_requests_per_minute, second.max_requests_per_minute);
    EXPECT_EQ(first.success_rate_threshold, second.success_rate_threshold);
    EXPECT_EQ(first.aggressive_mode, second.aggressive_mode);
    EXPECT_EQ(first.stealth_mode, second.stealth_mode);

    // A second resolver over the same config agrees too
    PolicyResolver other(config);
    Policy third = other.resolve("craftpix.net");
    EXPECT_EQ(first.base_delay, third.base_delay);
    EXPECT_EQ(first.max_requests_per_minute, third.max_requests_per_minute);
}

TEST(PolicyResolverTest, BaseDelayAboveMaxDelayIsRejected) {
    Config config;
    PolicyOverride broken;
    broken.base_delay = Duration(10000);
    broken.max_delay = Duration(5000);
    config.site_overrides["broken.example"] = broken;
    PolicyResolver resolver(config);

    EXPECT_THROW(resolver.resolve("broken.example"), PolicyViolation);
    // Never cached, so the caller keeps hearing about it
    EXPECT_THROW(resolver.resolve("broken.example"), PolicyViolation);

    try {
        resolver.resolve("broken.example");
    } catch (const PolicyViolation& e) {
        EXPECT_EQ(e.domain(), "broken.example");
    }

    EXPECT_NO_THROW(resolver.resolve("fine.example"));
}

TEST(PolicyResolverTest, OutOfRangeThresholdIsRejected) {
    Config config;
    PolicyOverride ov;
    ov.success_rate_threshold = 1.5;
    config.site_overrides["a.example"] = ov;

    PolicyOverride zero;
    zero.failure_threshold = 0;
    config.site_overrides["b.example"] = zero;

    PolicyResolver resolver(config);
    EXPECT_THROW(resolver.resolve("a.example"), PolicyViolation);
    EXPECT_THROW(resolver.resolve("b.example"), PolicyViolation);
}

TEST(PolicyResolverTest, NegativeDurationsAreRejected) {
    Config config;

    PolicyOverride recovery;
    recovery.recovery_timeout = Duration(-1000);
    config.site_overrides["recovery.example"] = recovery;

    PolicyOverride lifetime;
    lifetime.max_session_duration = Duration(-1);
    config.site_overrides["lifetime.example"] = lifetime;

    PolicyOverride jitter;
    jitter.session_renewal_jitter = Duration(-5000);
    config.site_overrides["jitter.example"] = jitter;

    // Checked even while long delays are disabled
    PolicyOverride long_delay;
    long_delay.long_delay_min = Duration(-30000);
    config.site_overrides["long.example"] = long_delay;

    PolicyResolver resolver(config);
    EXPECT_THROW(resolver.resolve("recovery.example"), PolicyViolation);
    EXPECT_THROW(resolver.resolve("lifetime.example"), PolicyViolation);
    EXPECT_THROW(resolver.resolve("jitter.example"), PolicyViolation);
    EXPECT_THROW(resolver.resolve("long.example"), PolicyViolation);
}

TEST(PolicyResolverTest, HourlyCapIsInheritedAndValidated) {
    Config config;

    PolicyOverride itch;
    itch.max_requests_per_hour = 30;
    config.site_overrides["itch.io"] = itch;

    PolicyOverride none;
    none.max_requests_per_hour = 0;
    config.site_overrides["none.example"] = none;

    PolicyResolver resolver(config);
    EXPECT_EQ(resolver.resolve("itch.io").max_requests_per_hour, 30);
    EXPECT_EQ(resolver.resolve("kenney.nl").max_requests_per_hour, 600);
    EXPECT_THROW(resolver.resolve("none.example"), PolicyViolation);
}

TEST(PolicyResolverTest, AggressiveOverrideClearsInheritedStealth) {
    Config config = config_with_sites();
    PolicyResolver resolver(config);

    Policy policy = resolver.resolve("craftpix.net");
    EXPECT_TRUE(policy.aggressive_mode);
    EXPECT_FALSE(policy.stealth_mode);
}

TEST(PolicyResolverTest, StealthOverrideClearsInheritedAggressive) {
    Policy base;
    base.aggressive_mode = true;
    base.stealth_mode = false;

    PolicyOverride ov;
    ov.stealth_mode = true;

    Policy merged = overlay_policy(base, ov);
    EXPECT_TRUE(merged.stealth_mode);
    EXPECT_FALSE(merged.aggressive_mode);
}

TEST(PolicyResolverTest, BothModesSetExplicitlyIsViolation) {
    Config config;
    PolicyOverride ov;
    ov.aggressive_mode = true;
    ov.stealth_mode = true;
    config.site_overrides["both.example"] = ov;
    PolicyResolver resolver(config);

    EXPECT_THROW(resolver.resolve("both.example"), PolicyViolation);
}

TEST(PolicyResolverTest, OverlayLeavesBaseUntouched) {
    Policy base;
    PolicyOverride ov;
    ov.max_requests_per_session = 5;
    ov.long_delay_enabled = true;
    ov.long_delay_probability = 0.2;

    Policy merged = overlay_policy(base, ov);
    EXPECT_EQ(merged.max_requests_per_session, 5);
    EXPECT_TRUE(merged.random_long_delay.enabled);
    EXPECT_DOUBLE_EQ(merged.random_long_delay.probability, 0.2);

    EXPECT_EQ(base.max_requests_per_session, 50);
    EXPECT_FALSE(base.random_long_delay.enabled);
}
