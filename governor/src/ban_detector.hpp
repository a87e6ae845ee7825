#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "failure_monitor.hpp"
#include "random_source.hpp"
#include "response_signal.hpp"
#include "types.hpp"
#include <optional>
#include <string>

// Maps response signals to emergency events. Rules are tried in order and
// the first match wins:
//   1. 403, a configured ban indicator in the body, or 429 while rate limit
//      detection is off -> IPBan, delayed by the circuit recovery timeout
//   2. CAPTCHA sightings in the failure window reached the threshold
//      -> CaptchaFlood, delayed by a draw from the emergency range
//   3. 429 -> RateLimited, delayed by Retry-After or the default backoff
// A CAPTCHA sighting or any match is also recorded as a detection for the
// domain's threat level.
class BanDetector {
public:
    BanDetector(const Config& config, FailureMonitor& monitor, RandomSource& random, const Clock& clock);

    std::optional<EmergencyEvent> inspect(const std::string& domain,
                                          const ResponseSignal& signal,
                                          const Policy& policy);

    bool is_captcha(const ResponseSignal& signal) const;

private:
    std::optional<EmergencyEvent> match(const std::string& domain,
                                        const ResponseSignal& signal,
                                        const Policy& policy,
                                        int captcha_count);
    bool is_ip_ban(const ResponseSignal& signal) const;
    EmergencyEvent make_event(const std::string& domain, EmergencyKind kind,
                              EmergencyAction action, Duration forced_delay) const;

    const EmergencyProtocols& protocols_;
    FailureMonitor& monitor_;
    RandomSource& random_;
    const Clock& clock_;
};
