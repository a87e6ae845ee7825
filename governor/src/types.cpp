#include "types.hpp"
#include "errors.hpp"

const char* to_string(EmergencyKind kind) {
    switch (kind) {
        case EmergencyKind::IPBan: return "ip_ban";
        case EmergencyKind::CaptchaFlood: return "captcha_flood";
        case EmergencyKind::RateLimited: return "rate_limited";
    }
    return "unknown";
}

const char* to_string(EmergencyAction action) {
    switch (action) {
        case EmergencyAction::SwitchProxyAndDelay: return "switch_proxy_and_delay";
        case EmergencyAction::LongDelayAndProfileChange: return "long_delay_and_profile_change";
        case EmergencyAction::Backoff: return "backoff";
    }
    return "unknown";
}

const char* to_string(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::Low: return "low";
        case ThreatLevel::Medium: return "medium";
        case ThreatLevel::High: return "high";
        case ThreatLevel::Critical: return "critical";
    }
    return "unknown";
}

EmergencyAction parse_emergency_action(const std::string& name) {
    if (name == "switch_proxy_and_delay") {
        return EmergencyAction::SwitchProxyAndDelay;
    } else if (name == "long_delay_and_profile_change") {
        return EmergencyAction::LongDelayAndProfileChange;
    } else if (name == "backoff") {
        return EmergencyAction::Backoff;
    }
    throw ConfigError("Unknown emergency response '" + name + "'");
}
