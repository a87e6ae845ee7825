#include "failure_monitor.hpp"
#include <spdlog/spdlog.h>

const char* to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

const char* to_string(RetryAction action) {
    switch (action) {
        case RetryAction::None: return "none";
        case RetryAction::RetryNow: return "retry_now";
        case RetryAction::RetryAfterBackoff: return "retry_after_backoff";
        case RetryAction::Abandon: return "abandon";
    }
    return "unknown";
}

const char* to_string(AbandonReason reason) {
    switch (reason) {
        case AbandonReason::None: return "none";
        case AbandonReason::CircuitOpen: return "circuit_open";
        case AbandonReason::RetryExhausted: return "retry_exhausted";
    }
    return "unknown";
}

FailureMonitor::FailureMonitor(const Config& config, const PacingEngine& pacing, const Clock& clock)
    : config_(config), pacing_(pacing), clock_(clock) {}

RetryDecision FailureMonitor::report(const std::string& domain, const Outcome& outcome, const Policy& policy) {
    auto now = clock_.now();

    return health_.with(domain, [&](DomainHealth& health) {
        health.window.push_back({outcome.success, now});
        trim(health, now);
        reassess(domain, health);

        RetryDecision decision;

        // Requests admitted before the trip still report while the trial is
        // out; they count in the window but cannot settle the circuit.
        if (health.circuit == CircuitState::HalfOpen && !outcome.trial) {
            if (!outcome.success) {
                decision.action = RetryAction::Abandon;
                decision.reason = AbandonReason::CircuitOpen;
            }
            return decision;
        }

        if (outcome.success) {
            switch (health.circuit) {
                case CircuitState::HalfOpen:
                    health.circuit = CircuitState::Closed;
                    health.trial_in_flight = false;
                    health.consecutive_failures = 0;
                    spdlog::info("Circuit for {} closed after successful trial request", domain);
                    break;
                case CircuitState::Open:
                    // Late success from before the trip; the breaker only
                    // recovers through a half-open trial.
                    break;
                case CircuitState::Closed:
                    health.consecutive_failures = 0;
                    break;
            }
            return decision;
        }

        health.consecutive_failures++;

        switch (health.circuit) {
            case CircuitState::HalfOpen:
                health.trial_in_flight = false;
                spdlog::warn("Trial request to {} failed, reopening circuit", domain);
                open_circuit(domain, health, now);
                break;
            case CircuitState::Closed:
                if (policy.circuit_breaker.enabled &&
                    health.consecutive_failures >= policy.circuit_breaker.failure_threshold) {
                    spdlog::warn("Circuit for {} opened after {} consecutive failures",
                                 domain, health.consecutive_failures);
                    open_circuit(domain, health, now);
                }
                break;
            case CircuitState::Open:
                break;
        }

        if (health.circuit == CircuitState::Open) {
            decision.action = RetryAction::Abandon;
            decision.reason = AbandonReason::CircuitOpen;
        } else if (outcome.attempt > policy.retry_attempts) {
            decision.action = RetryAction::Abandon;
            decision.reason = AbandonReason::RetryExhausted;
            spdlog::info("Giving up on {} after {} attempts", domain, outcome.attempt);
        } else if (!policy.exponential_backoff) {
            decision.action = RetryAction::RetryNow;
        } else {
            decision.action = RetryAction::RetryAfterBackoff;
            decision.delay = pacing_.backoff_delay(policy, outcome.attempt);
        }

        return decision;
    });
}

bool FailureMonitor::is_healthy(const std::string& domain, const Policy& policy) {
    auto now = clock_.now();
    bool healthy = true;
    health_.with_existing(domain, [&](DomainHealth& health) {
        trim(health, now);
        if (health.consecutive_failures >= policy.max_failed_requests) {
            healthy = false;
        } else if (rate_of(health) < policy.success_rate_threshold) {
            healthy = false;
        }
    });
    return healthy;
}

CircuitGate FailureMonitor::try_admit(const std::string& domain, const Policy& policy) {
    auto now = clock_.now();
    const auto& breaker = policy.circuit_breaker;

    return health_.with(domain, [&](DomainHealth& health) {
        CircuitGate gate;
        gate.state = health.circuit;

        if (!breaker.enabled) {
            return gate;
        }

        switch (health.circuit) {
            case CircuitState::Closed:
                break;

            case CircuitState::Open: {
                auto elapsed = std::chrono::duration_cast<Duration>(now - health.opened_at);
                if (elapsed < breaker.recovery_timeout) {
                    gate.admitted = false;
                    gate.retry_in = breaker.recovery_timeout - elapsed;
                    break;
                }
                health.circuit = CircuitState::HalfOpen;
                health.trial_in_flight = true;
                health.trial_started = now;
                gate.state = CircuitState::HalfOpen;
                gate.trial = true;
                spdlog::info("Circuit for {} half-open, admitting one trial request", domain);
                break;
            }

            case CircuitState::HalfOpen: {
                // A trial whose caller never reported back expires after one
                // recovery period so the domain is not stuck half-open.
                auto outstanding = std::chrono::duration_cast<Duration>(now - health.trial_started);
                if (health.trial_in_flight && outstanding < breaker.recovery_timeout) {
                    gate.admitted = false;
                    gate.retry_in = breaker.recovery_timeout - outstanding;
                    break;
                }
                health.trial_in_flight = true;
                health.trial_started = now;
                gate.trial = true;
                break;
            }
        }

        return gate;
    });
}

int FailureMonitor::record_captcha(const std::string& domain) {
    auto now = clock_.now();
    return health_.with(domain, [&](DomainHealth& health) {
        health.captchas.push_back(now);
        trim(health, now);
        return static_cast<int>(health.captchas.size());
    });
}

void FailureMonitor::record_detection(const std::string& domain) {
    auto now = clock_.now();
    health_.with(domain, [&](DomainHealth& health) {
        health.detections.push_back(now);
        trim(health, now);
        reassess(domain, health);
    });
}

ThreatLevel FailureMonitor::threat_level(const std::string& domain) {
    auto now = clock_.now();
    ThreatLevel level = ThreatLevel::Low;
    health_.with_existing(domain, [&](DomainHealth& health) {
        trim(health, now);
        reassess(domain, health);
        level = health.threat;
    });
    return level;
}

double FailureMonitor::success_rate(const std::string& domain) {
    auto now = clock_.now();
    double rate = 1.0;
    health_.with_existing(domain, [&](DomainHealth& health) {
        trim(health, now);
        rate = rate_of(health);
    });
    return rate;
}

int FailureMonitor::consecutive_failures(const std::string& domain) {
    int streak = 0;
    health_.with_existing(domain, [&](DomainHealth& health) { streak = health.consecutive_failures; });
    return streak;
}

CircuitState FailureMonitor::circuit_state(const std::string& domain) {
    CircuitState state = CircuitState::Closed;
    health_.with_existing(domain, [&](DomainHealth& health) { state = health.circuit; });
    return state;
}

void FailureMonitor::trim(DomainHealth& health, time_point now) const {
    auto horizon = now - config_.failure_window;

    while (!health.window.empty() && health.window.front().at < horizon) {
        health.window.pop_front();
    }
    while (health.window.size() > config_.failure_window_size) {
        health.window.pop_front();
    }
    while (!health.captchas.empty() && health.captchas.front() < horizon) {
        health.captchas.pop_front();
    }
    while (!health.detections.empty() && health.detections.front() < horizon) {
        health.detections.pop_front();
    }
}

void FailureMonitor::reassess(const std::string& domain, DomainHealth& health) {
    ThreatLevel level = ThreatLevel::Low;

    if (config_.threat_assessment && health.window.size() >= config_.threat_min_samples) {
        double success = rate_of(health);
        double detected = static_cast<double>(health.detections.size()) /
                          static_cast<double>(health.window.size());

        if (success < 0.5 || detected > 0.5) {
            level = ThreatLevel::Critical;
        } else if (success < 0.7 || detected > 0.3) {
            level = ThreatLevel::High;
        } else if (success < 0.85 || detected > 0.15) {
            level = ThreatLevel::Medium;
        }
    }

    if (level != health.threat) {
        spdlog::info("Threat level for {} changed from {} to {}", domain, to_string(health.threat), to_string(level));
        health.threat = level;
    }
}

void FailureMonitor::open_circuit(const std::string& domain, DomainHealth& health, time_point now) {
    health.circuit = CircuitState::Open;
    health.opened_at = now;
    spdlog::debug("Circuit for {} open until recovery timeout, streak {}", domain, health.consecutive_failures);
}

double FailureMonitor::rate_of(const DomainHealth& health) {
    if (health.window.empty()) {
        return 1.0;
    }

    size_t successes = 0;
    for (const auto& record : health.window) {
        if (record.success) {
            successes++;
        }
    }
    return static_cast<double>(successes) / static_cast<double>(health.window.size());
}
