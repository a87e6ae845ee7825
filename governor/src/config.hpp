#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct IpBanDetection {
    bool enabled = true;
    std::vector<std::string> indicators = {
        "Access denied",
        "You have been blocked",
        "banned",
        "unusual traffic"
    };
    EmergencyAction response = EmergencyAction::SwitchProxyAndDelay;
};

struct CaptchaFloodDetection {
    bool enabled = true;
    int threshold = 3;
    EmergencyAction response = EmergencyAction::LongDelayAndProfileChange;
    // Emergency pause range, independent of request_patterns.random_long_delays
    Duration min_delay{std::chrono::minutes(5)};
    Duration max_delay{std::chrono::minutes(15)};
    std::vector<std::string> indicators = {
        "g-recaptcha",
        "h-captcha",
        "cf-challenge",
        "captcha"
    };
};

struct RateLimitDetection {
    bool enabled = true;
    bool respect_retry_after = true;
    Duration default_backoff{std::chrono::seconds(60)};
};

struct EmergencyProtocols {
    IpBanDetection ip_ban;
    CaptchaFloodDetection captcha_flood;
    RateLimitDetection rate_limit;
};

struct SecurityFeatures {
    bool enable_proxy_rotation = false;
    bool enable_profile_rotation = true;
    bool enable_captcha_solving = false;
    bool enable_cloudflare_bypass = false;
    bool enable_javascript_rendering = false;
};

struct DetectionEvasion {
    bool randomize_headers = true;
    bool randomize_tls_fingerprint = true;
    bool simulate_human_behavior = true;
    bool header_order_randomization = true;
    bool tcp_fingerprint_randomization = false;
};

class Config {
public:
    // Service info
    std::string service_name = "governor";
    std::string log_level = "info";
    std::string config_path;
    std::optional<uint64_t> seed;

    // Probe driver
    int worker_threads = 2;
    Duration request_timeout{std::chrono::seconds(30)};
    Duration fetch_deadline{std::chrono::minutes(10)};

    // Session management
    bool cookie_persistence = true;
    bool session_fingerprint_rotation = true;

    // Request patterns
    bool burst_protection = true;
    bool human_like_patterns = true;

    // Failure window
    Duration failure_window{std::chrono::minutes(5)};
    size_t failure_window_size = 100;
    Duration max_backoff{std::chrono::minutes(5)};

    // Threat level: raises pacing for domains that keep failing or tripping detectors
    bool threat_assessment = true;
    size_t threat_min_samples = 10;

    Policy global_policy;
    std::unordered_map<std::string, PolicyOverride> site_overrides;

    SecurityFeatures security;
    DetectionEvasion evasion;
    EmergencyProtocols emergency;

    std::vector<std::string> user_agents = {
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:122.0) Gecko/20100101 Firefox/122.0",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:122.0) Gecko/20100101 Firefox/122.0",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.2 Safari/605.1.15",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36 Edg/121.0.0.0",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36"
    };

    static Config from_env();
    static Config from_json(const nlohmann::json& doc);
    static Config load_file(const std::string& path);
    void validate() const;
};
