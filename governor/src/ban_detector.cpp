#include "ban_detector.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

BanDetector::BanDetector(const Config& config, FailureMonitor& monitor, RandomSource& random, const Clock& clock)
    : protocols_(config.emergency), monitor_(monitor), random_(random), clock_(clock) {}

std::optional<EmergencyEvent> BanDetector::inspect(const std::string& domain,
                                                   const ResponseSignal& signal,
                                                   const Policy& policy) {
    // Count the sighting before matching so a ban taking priority still
    // leaves it in the window.
    int captcha_count = 0;
    if (protocols_.captcha_flood.enabled && is_captcha(signal)) {
        captcha_count = monitor_.record_captcha(domain);
        spdlog::debug("CAPTCHA challenge from {} ({} in window)", domain, captcha_count);
    }

    auto event = match(domain, signal, policy, captcha_count);
    if (event || captcha_count > 0) {
        monitor_.record_detection(domain);
    }
    return event;
}

std::optional<EmergencyEvent> BanDetector::match(const std::string& domain,
                                                 const ResponseSignal& signal,
                                                 const Policy& policy,
                                                 int captcha_count) {

    if (protocols_.ip_ban.enabled && is_ip_ban(signal)) {
        return make_event(domain, EmergencyKind::IPBan, protocols_.ip_ban.response,
                          policy.circuit_breaker.recovery_timeout);
    }

    const auto& flood = protocols_.captcha_flood;
    if (flood.enabled && captcha_count >= flood.threshold) {
        double pause = random_.uniform(static_cast<double>(flood.min_delay.count()),
                                       static_cast<double>(flood.max_delay.count()));
        return make_event(domain, EmergencyKind::CaptchaFlood, flood.response,
                          Duration(static_cast<long long>(pause)));
    }

    const auto& rate_limit = protocols_.rate_limit;
    if (rate_limit.enabled && signal.status == 429) {
        Duration wait = rate_limit.default_backoff;
        if (rate_limit.respect_retry_after && signal.retry_after) {
            wait = *signal.retry_after;
        }
        return make_event(domain, EmergencyKind::RateLimited, EmergencyAction::Backoff, wait);
    }

    return std::nullopt;
}

bool BanDetector::is_captcha(const ResponseSignal& signal) const {
    if (signal.captcha_challenge) {
        return true;
    }
    for (const auto& marker : protocols_.captcha_flood.indicators) {
        if (util::contains_ignore_case(signal.body_excerpt, marker)) {
            return true;
        }
    }
    return false;
}

bool BanDetector::is_ip_ban(const ResponseSignal& signal) const {
    if (signal.status == 403) {
        return true;
    }
    if (signal.status == 429 && !protocols_.rate_limit.enabled) {
        return true;
    }
    for (const auto& indicator : protocols_.ip_ban.indicators) {
        if (util::contains_ignore_case(signal.body_excerpt, indicator)) {
            return true;
        }
    }
    return false;
}

EmergencyEvent BanDetector::make_event(const std::string& domain, EmergencyKind kind,
                                       EmergencyAction action, Duration forced_delay) const {
    EmergencyEvent event;
    event.domain = domain;
    event.kind = kind;
    event.action = action;
    event.forced_delay = forced_delay;
    event.detected_at = clock_.now();
    return event;
}
