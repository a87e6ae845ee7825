#include "policy_resolver.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

template <typename T>
void apply(T& field, const std::optional<T>& value) {
    if (value) {
        field = *value;
    }
}

} // namespace

Policy overlay_policy(const Policy& base, const PolicyOverride& ov) {
    Policy p = base;

    apply(p.max_requests_per_session, ov.max_requests_per_session);
    apply(p.max_session_duration, ov.max_session_duration);
    apply(p.session_renewal_jitter, ov.session_renewal_jitter);

    apply(p.base_delay, ov.base_delay);
    apply(p.max_delay, ov.max_delay);
    apply(p.delay_jitter, ov.delay_jitter);
    apply(p.min_delay, ov.min_delay);
    apply(p.max_requests_per_minute, ov.max_requests_per_minute);
    apply(p.max_requests_per_hour, ov.max_requests_per_hour);
    apply(p.random_long_delay.enabled, ov.long_delay_enabled);
    apply(p.random_long_delay.probability, ov.long_delay_probability);
    apply(p.random_long_delay.min_delay, ov.long_delay_min);
    apply(p.random_long_delay.max_delay, ov.long_delay_max);

    apply(p.max_failed_requests, ov.max_failed_requests);
    apply(p.success_rate_threshold, ov.success_rate_threshold);
    apply(p.retry_attempts, ov.retry_attempts);
    apply(p.exponential_backoff, ov.exponential_backoff);
    apply(p.circuit_breaker.enabled, ov.circuit_breaker_enabled);
    apply(p.circuit_breaker.failure_threshold, ov.failure_threshold);
    apply(p.circuit_breaker.recovery_timeout, ov.recovery_timeout);

    // The overriding level decides the delay bias; turning one mode on
    // clears the inherited other unless both are set explicitly.
    apply(p.aggressive_mode, ov.aggressive_mode);
    apply(p.stealth_mode, ov.stealth_mode);
    if (ov.aggressive_mode.value_or(false) && !ov.stealth_mode) {
        p.stealth_mode = false;
    }
    if (ov.stealth_mode.value_or(false) && !ov.aggressive_mode) {
        p.aggressive_mode = false;
    }

    apply(p.requires_javascript, ov.requires_javascript);
    apply(p.requires_login, ov.requires_login);

    return p;
}

void validate_policy(const Policy& policy, const std::string& domain) {
    if (policy.base_delay > policy.max_delay) {
        throw PolicyViolation(domain, "base_delay exceeds max_delay");
    }
    if (policy.base_delay.count() < 0 || policy.delay_jitter.count() < 0 || policy.min_delay.count() < 0) {
        throw PolicyViolation(domain, "delays must not be negative");
    }
    if (policy.max_session_duration.count() < 0 || policy.session_renewal_jitter.count() < 0) {
        throw PolicyViolation(domain, "session durations must not be negative");
    }
    if (policy.max_requests_per_session < 1) {
        throw PolicyViolation(domain, "max_requests_per_session must be at least 1");
    }
    if (policy.max_requests_per_minute < 1) {
        throw PolicyViolation(domain, "max_requests_per_minute must be at least 1");
    }
    if (policy.max_requests_per_hour < 1) {
        throw PolicyViolation(domain, "max_requests_per_hour must be at least 1");
    }
    if (policy.success_rate_threshold < 0.0 || policy.success_rate_threshold > 1.0) {
        throw PolicyViolation(domain, "success_rate_threshold must be within [0, 1]");
    }
    if (policy.circuit_breaker.failure_threshold < 1) {
        throw PolicyViolation(domain, "circuit_breaker.failure_threshold must be at least 1");
    }
    if (policy.circuit_breaker.recovery_timeout.count() < 0) {
        throw PolicyViolation(domain, "circuit_breaker.recovery_timeout must not be negative");
    }
    if (policy.retry_attempts < 0) {
        throw PolicyViolation(domain, "retry_attempts must not be negative");
    }

    const auto& long_delay = policy.random_long_delay;
    if (long_delay.probability < 0.0 || long_delay.probability > 1.0) {
        throw PolicyViolation(domain, "random_long_delays.probability must be within [0, 1]");
    }
    if (long_delay.min_delay.count() < 0) {
        throw PolicyViolation(domain, "random_long_delays.min_delay must not be negative");
    }
    if (long_delay.enabled && long_delay.min_delay > long_delay.max_delay) {
        throw PolicyViolation(domain, "random_long_delays.min_delay exceeds max_delay");
    }

    if (policy.aggressive_mode && policy.stealth_mode) {
        throw PolicyViolation(domain, "aggressive_mode and stealth_mode are mutually exclusive");
    }
}

PolicyResolver::PolicyResolver(const Config& config) : config_(config) {}

Policy PolicyResolver::resolve(const std::string& domain) {
    std::string key = util::to_lower(domain);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    const PolicyOverride* ov = find_override(key);
    Policy policy = ov ? overlay_policy(config_.global_policy, *ov) : config_.global_policy;

    try {
        validate_policy(policy, key);
    } catch (const PolicyViolation& e) {
        spdlog::error("Rejecting site override: {}", e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_.emplace(key, policy);
    return policy;
}

bool PolicyResolver::has_override(const std::string& domain) const {
    return find_override(util::to_lower(domain)) != nullptr;
}

const PolicyOverride* PolicyResolver::find_override(const std::string& domain) const {
    auto it = config_.site_overrides.find(domain);
    if (it != config_.site_overrides.end()) {
        return &it->second;
    }

    if (util::starts_with(domain, "www.")) {
        it = config_.site_overrides.find(domain.substr(4));
        if (it != config_.site_overrides.end()) {
            return &it->second;
        }
    }

    return nullptr;
}
