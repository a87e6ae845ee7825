#include "config.hpp"
#include "errors.hpp"
#include "policy_resolver.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

using nlohmann::json;

namespace {

const char* kPolicySections[] = {
    "session_management",
    "request_patterns",
    "failure_handling",
    "security_features"
};

template <typename T>
void read_value(const json& node, const char* key, std::optional<T>& out) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

template <typename T>
void read_value(const json& node, const char* key, T& out) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

// Durations are written in seconds, fractional values allowed
void read_seconds(const json& node, const char* key, std::optional<Duration>& out) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        out = util::seconds_to_ms(it->get<double>());
    }
}

void read_seconds(const json& node, const char* key, Duration& out) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        out = util::seconds_to_ms(it->get<double>());
    }
}

// Reads every policy key present directly in `node`.
void read_policy_fields(const json& node, PolicyOverride& ov) {
    read_value(node, "max_requests_per_session", ov.max_requests_per_session);
    read_seconds(node, "max_session_duration", ov.max_session_duration);
    read_seconds(node, "session_renewal_jitter", ov.session_renewal_jitter);

    read_seconds(node, "base_delay", ov.base_delay);
    read_seconds(node, "max_delay", ov.max_delay);
    read_seconds(node, "delay_jitter", ov.delay_jitter);
    read_seconds(node, "min_delay", ov.min_delay);
    read_value(node, "max_requests_per_minute", ov.max_requests_per_minute);
    read_value(node, "max_requests_per_hour", ov.max_requests_per_hour);

    auto long_delays = node.find("random_long_delays");
    if (long_delays != node.end() && long_delays->is_object()) {
        read_value(*long_delays, "enabled", ov.long_delay_enabled);
        read_value(*long_delays, "probability", ov.long_delay_probability);
        read_seconds(*long_delays, "min_delay", ov.long_delay_min);
        read_seconds(*long_delays, "max_delay", ov.long_delay_max);
    }

    read_value(node, "max_failed_requests", ov.max_failed_requests);
    read_value(node, "success_rate_threshold", ov.success_rate_threshold);
    read_value(node, "retry_attempts", ov.retry_attempts);
    read_value(node, "exponential_backoff", ov.exponential_backoff);

    auto breaker = node.find("circuit_breaker");
    if (breaker != node.end() && breaker->is_object()) {
        read_value(*breaker, "enabled", ov.circuit_breaker_enabled);
        read_value(*breaker, "failure_threshold", ov.failure_threshold);
        read_seconds(*breaker, "recovery_timeout", ov.recovery_timeout);
    }

    read_value(node, "aggressive_mode", ov.aggressive_mode);
    read_value(node, "stealth_mode", ov.stealth_mode);
    read_value(node, "requires_javascript", ov.requires_javascript);
    read_value(node, "requires_login", ov.requires_login);
}

// Site entries may repeat the global section layout or list fields flat.
PolicyOverride parse_override(const json& node) {
    PolicyOverride ov;
    read_policy_fields(node, ov);
    for (const char* section : kPolicySections) {
        auto it = node.find(section);
        if (it != node.end() && it->is_object()) {
            read_policy_fields(*it, ov);
        }
    }
    return ov;
}

void parse_emergency(const json& node, EmergencyProtocols& emergency) {
    auto ip_ban = node.find("ip_ban_detection");
    if (ip_ban != node.end()) {
        read_value(*ip_ban, "enabled", emergency.ip_ban.enabled);
        read_value(*ip_ban, "indicators", emergency.ip_ban.indicators);
        if (ip_ban->contains("response")) {
            emergency.ip_ban.response = parse_emergency_action(ip_ban->at("response").get<std::string>());
        }
    }

    auto captcha = node.find("captcha_flood");
    if (captcha != node.end()) {
        read_value(*captcha, "enabled", emergency.captcha_flood.enabled);
        read_value(*captcha, "threshold", emergency.captcha_flood.threshold);
        read_seconds(*captcha, "min_delay", emergency.captcha_flood.min_delay);
        read_seconds(*captcha, "max_delay", emergency.captcha_flood.max_delay);
        read_value(*captcha, "indicators", emergency.captcha_flood.indicators);
        if (captcha->contains("response")) {
            emergency.captcha_flood.response = parse_emergency_action(captcha->at("response").get<std::string>());
        }
    }

    auto rate_limit = node.find("rate_limit_detection");
    if (rate_limit != node.end()) {
        read_value(*rate_limit, "enabled", emergency.rate_limit.enabled);
        read_value(*rate_limit, "respect_retry_after", emergency.rate_limit.respect_retry_after);
        read_seconds(*rate_limit, "default_backoff", emergency.rate_limit.default_backoff);
    }
}

} // namespace

Config Config::from_env() {
    Config config;

    config.config_path = util::get_env_var("GOVERNOR_CONFIG");
    if (!config.config_path.empty()) {
        config = load_file(config.config_path);
    }

    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    try {
        config.worker_threads = std::stoi(util::get_env_var("PROBE_WORKERS", std::to_string(config.worker_threads)));
        config.request_timeout = util::seconds_to_ms(std::stod(util::get_env_var(
            "REQUEST_TIMEOUT_SECONDS", std::to_string(util::ms_to_seconds(config.request_timeout)))));
        config.fetch_deadline = util::seconds_to_ms(std::stod(util::get_env_var(
            "FETCH_DEADLINE_SECONDS", std::to_string(util::ms_to_seconds(config.fetch_deadline)))));
    } catch (const std::exception& e) {
        throw ConfigError(std::string("Invalid probe setting in environment: ") + e.what());
    }

    std::string seed = util::get_env_var("GOVERNOR_SEED");
    if (!seed.empty()) {
        try {
            config.seed = std::stoull(seed);
        } catch (const std::exception&) {
            throw ConfigError("GOVERNOR_SEED must be an unsigned integer, got '" + seed + "'");
        }
    }

    return config;
}

Config Config::from_json(const json& doc) {
    Config config;

    try {
        if (!doc.is_object()) {
            throw ConfigError("Configuration document must be a JSON object");
        }

        PolicyOverride global;
        for (const char* section : kPolicySections) {
            auto it = doc.find(section);
            if (it != doc.end() && it->is_object()) {
                read_policy_fields(*it, global);
            }
        }

        auto sessions = doc.find("session_management");
        if (sessions != doc.end()) {
            read_value(*sessions, "cookie_persistence", config.cookie_persistence);
            read_value(*sessions, "session_fingerprint_rotation", config.session_fingerprint_rotation);
        }

        auto patterns = doc.find("request_patterns");
        if (patterns != doc.end()) {
            read_value(*patterns, "burst_protection", config.burst_protection);
            read_value(*patterns, "human_like_patterns", config.human_like_patterns);
        }

        auto failures = doc.find("failure_handling");
        if (failures != doc.end()) {
            read_seconds(*failures, "window_seconds", config.failure_window);
            read_value(*failures, "window_size", config.failure_window_size);
            read_seconds(*failures, "max_backoff", config.max_backoff);
        }

        auto adaptive = doc.find("adaptive_security");
        if (adaptive != doc.end()) {
            read_value(*adaptive, "threat_assessment", config.threat_assessment);
            read_value(*adaptive, "min_samples", config.threat_min_samples);
        }

        auto security = doc.find("security_features");
        if (security != doc.end()) {
            read_value(*security, "enable_proxy_rotation", config.security.enable_proxy_rotation);
            read_value(*security, "enable_profile_rotation", config.security.enable_profile_rotation);
            read_value(*security, "enable_captcha_solving", config.security.enable_captcha_solving);
            read_value(*security, "enable_cloudflare_bypass", config.security.enable_cloudflare_bypass);
            read_value(*security, "enable_javascript_rendering", config.security.enable_javascript_rendering);
        }

        auto evasion = doc.find("detection_evasion");
        if (evasion != doc.end()) {
            read_value(*evasion, "randomize_headers", config.evasion.randomize_headers);
            read_value(*evasion, "randomize_tls_fingerprint", config.evasion.randomize_tls_fingerprint);
            read_value(*evasion, "simulate_human_behavior", config.evasion.simulate_human_behavior);
            read_value(*evasion, "header_order_randomization", config.evasion.header_order_randomization);
            read_value(*evasion, "tcp_fingerprint_randomization", config.evasion.tcp_fingerprint_randomization);
        }

        auto emergency = doc.find("emergency_protocols");
        if (emergency != doc.end()) {
            parse_emergency(*emergency, config.emergency);
        }

        auto sites = doc.find("site_specific");
        if (sites != doc.end()) {
            for (auto it = sites->begin(); it != sites->end(); ++it) {
                config.site_overrides[util::to_lower(it.key())] = parse_override(it.value());
            }
        }

        auto identity = doc.find("identity");
        if (identity != doc.end() && identity->contains("profiles")) {
            std::vector<std::string> agents;
            for (const auto& profile : identity->at("profiles")) {
                agents.push_back(profile.at("user_agent").get<std::string>());
            }
            config.user_agents = std::move(agents);
        }

        config.global_policy = overlay_policy(Policy{}, global);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration document: ") + e.what());
    }

    return config;
}

Config Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file " + path);
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }

    Config config = from_json(doc);
    config.config_path = path;
    spdlog::info("Loaded governor configuration from {} ({} site overrides)",
                 path, config.site_overrides.size());
    return config;
}

void Config::validate() const {
    try {
        validate_policy(global_policy, "default");
    } catch (const PolicyViolation& e) {
        throw ConfigError(e.what());
    }

    if (user_agents.empty()) {
        throw ConfigError("At least one identity profile is required");
    }

    if (worker_threads < 1 || worker_threads > 64) {
        throw ConfigError("PROBE_WORKERS must be between 1 and 64");
    }

    if (failure_window_size < 1) {
        throw ConfigError("failure_handling.window_size must be at least 1");
    }

    if (threat_min_samples < 1) {
        throw ConfigError("adaptive_security.min_samples must be at least 1");
    }

    if (emergency.captcha_flood.threshold < 1) {
        throw ConfigError("captcha_flood.threshold must be at least 1");
    }

    if (emergency.captcha_flood.min_delay > emergency.captcha_flood.max_delay) {
        throw ConfigError("captcha_flood.min_delay must not exceed captcha_flood.max_delay");
    }

    spdlog::info("Configuration validated successfully");
}
