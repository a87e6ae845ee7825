#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using Duration = std::chrono::milliseconds;

struct RandomLongDelay {
    bool enabled = false;
    double probability = 0.0;
    Duration min_delay{0};
    Duration max_delay{0};
};

struct CircuitBreakerSettings {
    bool enabled = true;
    int failure_threshold = 5;
    Duration recovery_timeout{std::chrono::seconds(60)};
};

// Effective limits for one domain. Built once by PolicyResolver and never mutated.
struct Policy {
    // Session management
    int max_requests_per_session = 50;
    Duration max_session_duration{std::chrono::hours(1)};
    Duration session_renewal_jitter{std::chrono::minutes(5)};

    // Request patterns
    Duration base_delay{std::chrono::seconds(2)};
    Duration max_delay{std::chrono::seconds(8)};
    Duration delay_jitter{std::chrono::seconds(3)};
    Duration min_delay{std::chrono::milliseconds(500)};
    int max_requests_per_minute = 30;
    int max_requests_per_hour = 600;
    RandomLongDelay random_long_delay;

    // Failure handling
    int max_failed_requests = 10;
    double success_rate_threshold = 0.7;
    int retry_attempts = 3;
    bool exponential_backoff = true;
    CircuitBreakerSettings circuit_breaker;

    // Security features
    bool aggressive_mode = false;
    bool stealth_mode = true;

    // Capability flags, surfaced to the caller only
    bool requires_javascript = false;
    bool requires_login = false;
};

// Subset of Policy fields a site_specific entry may carry.
struct PolicyOverride {
    std::optional<int> max_requests_per_session;
    std::optional<Duration> max_session_duration;
    std::optional<Duration> session_renewal_jitter;

    std::optional<Duration> base_delay;
    std::optional<Duration> max_delay;
    std::optional<Duration> delay_jitter;
    std::optional<Duration> min_delay;
    std::optional<int> max_requests_per_minute;
    std::optional<int> max_requests_per_hour;
    std::optional<bool> long_delay_enabled;
    std::optional<double> long_delay_probability;
    std::optional<Duration> long_delay_min;
    std::optional<Duration> long_delay_max;

    std::optional<int> max_failed_requests;
    std::optional<double> success_rate_threshold;
    std::optional<int> retry_attempts;
    std::optional<bool> exponential_backoff;
    std::optional<bool> circuit_breaker_enabled;
    std::optional<int> failure_threshold;
    std::optional<Duration> recovery_timeout;

    std::optional<bool> aggressive_mode;
    std::optional<bool> stealth_mode;

    std::optional<bool> requires_javascript;
    std::optional<bool> requires_login;
};

struct Fingerprint {
    std::string user_agent;
    uint64_t header_order_seed = 0;
    uint64_t tls_profile_seed = 0;
};

enum class EmergencyKind {
    IPBan,
    CaptchaFlood,
    RateLimited
};

enum class EmergencyAction {
    SwitchProxyAndDelay,
    LongDelayAndProfileChange,
    Backoff
};

struct EmergencyEvent {
    std::string domain;
    EmergencyKind kind = EmergencyKind::IPBan;
    EmergencyAction action = EmergencyAction::Backoff;
    Duration forced_delay{0};
    std::chrono::steady_clock::time_point detected_at;
};

// Domain-wide detection pressure, assessed from the failure window
enum class ThreatLevel {
    Low,
    Medium,
    High,
    Critical
};

const char* to_string(EmergencyKind kind);
const char* to_string(EmergencyAction action);
const char* to_string(ThreatLevel level);

// Throws ConfigError for strings outside the closed action set
EmergencyAction parse_emergency_action(const std::string& name);
