#include "pacing_engine.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace {

// Keeps the pushed send time strictly past the window edge
constexpr Duration kRateSlack{1};

struct ThreatFloor {
    Duration base_delay;
    Duration max_delay;
};

ThreatFloor floor_for(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::Low: break;
        case ThreatLevel::Medium: return {std::chrono::seconds(2), std::chrono::seconds(8)};
        case ThreatLevel::High: return {std::chrono::seconds(3), std::chrono::seconds(15)};
        case ThreatLevel::Critical: return {std::chrono::seconds(5), std::chrono::seconds(30)};
    }
    return {Duration(0), Duration(0)};
}

} // namespace

Policy adapt_to_threat(const Policy& policy, ThreatLevel level) {
    if (level == ThreatLevel::Low) {
        return policy;
    }

    Policy adapted = policy;
    adapted.aggressive_mode = false;
    adapted.stealth_mode = true;

    ThreatFloor floor = floor_for(level);
    adapted.base_delay = std::max(adapted.base_delay, floor.base_delay);
    adapted.max_delay = std::max(adapted.max_delay, floor.max_delay);
    return adapted;
}

PacingEngine::PacingEngine(const Config& config, RandomSource& random, const Clock& clock)
    : config_(config), random_(random), clock_(clock) {}

Reservation PacingEngine::reserve(const Session& session, const Policy& base_policy, ThreatLevel threat) {
    Policy policy = adapt_to_threat(base_policy, threat);
    Duration pause = pacing_delay(policy);
    auto now = clock_.now();

    return pacing_.with(session.domain, [&](DomainPacing& state) {
        prune(state, now);

        time_point send = now + pause;
        if (!state.sends.empty()) {
            send = std::max(now, state.sends.back()) + pause;
        }
        if (state.emergency_until > send) {
            send = state.emergency_until;
        }

        if (config_.burst_protection) {
            time_point capped = apply_cap(state, send, policy.max_requests_per_minute, kRateWindow);
            capped = apply_cap(state, capped, policy.max_requests_per_hour, kHourWindow);
            if (capped > send) {
                spdlog::debug("Rate cap ({}/min, {}/h) reached for {}, pushing send by {}s",
                              policy.max_requests_per_minute, policy.max_requests_per_hour, session.domain,
                              util::ms_to_seconds(std::chrono::duration_cast<Duration>(capped - send)));
                send = capped;
            }
        }

        state.sends.push_back(send);

        Reservation reservation;
        reservation.wait = std::chrono::duration_cast<Duration>(send - now);
        reservation.send_at = send;
        return reservation;
    });
}

Duration PacingEngine::next_delay(const Session& session, const Policy& policy) {
    return reserve(session, policy).wait;
}

void PacingEngine::release(const std::string& domain, Clock::time_point send_at) {
    pacing_.with_existing(domain, [&](DomainPacing& state) {
        auto it = std::find(state.sends.rbegin(), state.sends.rend(), send_at);
        if (it != state.sends.rend()) {
            state.sends.erase(std::next(it).base());
            spdlog::debug("Released unsent reservation for {}", domain);
        }
    });
}

void PacingEngine::note_emergency_delay(const std::string& domain, EmergencyKind kind, Duration duration) {
    auto now = clock_.now();
    pacing_.with(domain, [&](DomainPacing& state) {
        time_point until = now + duration;
        if (until > state.emergency_until) {
            state.emergency_until = until;
            spdlog::warn("Emergency delay of {}s for {} ({})",
                         util::ms_to_seconds(duration), domain, to_string(kind));
        }
    });
}

Duration PacingEngine::emergency_delay_remaining(const std::string& domain) {
    auto now = clock_.now();
    Duration remaining{0};
    pacing_.with_existing(domain, [&](DomainPacing& state) {
        if (state.emergency_until > now) {
            remaining = std::chrono::duration_cast<Duration>(state.emergency_until - now);
        }
    });
    return remaining;
}

Duration PacingEngine::backoff_delay(const Policy& policy, int attempt) const {
    if (attempt <= 0) {
        return Duration(0);
    }

    double delay_ms = static_cast<double>(policy.base_delay.count()) * std::pow(2.0, attempt - 1);
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_backoff.count()));
    return Duration(static_cast<long long>(delay_ms));
}

int PacingEngine::requests_in_window(const std::string& domain) {
    auto now = clock_.now();
    int count = 0;
    pacing_.with_existing(domain, [&](DomainPacing& state) {
        prune(state, now);
        count = static_cast<int>(std::count_if(state.sends.begin(), state.sends.end(),
                                               [&](time_point send) { return send > now - kRateWindow; }));
    });
    return count;
}

int PacingEngine::requests_in_hour(const std::string& domain) {
    auto now = clock_.now();
    int count = 0;
    pacing_.with_existing(domain, [&](DomainPacing& state) {
        prune(state, now);
        count = static_cast<int>(state.sends.size());
    });
    return count;
}

Duration PacingEngine::pacing_delay(const Policy& policy) {
    const auto& long_delay = policy.random_long_delay;
    if (config_.human_like_patterns && long_delay.enabled && random_.bernoulli(long_delay.probability)) {
        double pause = random_.uniform(static_cast<double>(long_delay.min_delay.count()),
                                       static_cast<double>(long_delay.max_delay.count()));
        return Duration(static_cast<long long>(pause));
    }

    double base = static_cast<double>(policy.base_delay.count());
    if (policy.aggressive_mode) {
        base = std::max(base * kAggressiveFactor, static_cast<double>(policy.min_delay.count()));
    } else if (policy.stealth_mode) {
        base *= kStealthFactor;
    }

    double delay = base + random_.uniform(0.0, static_cast<double>(policy.delay_jitter.count()));
    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));
    return Duration(static_cast<long long>(delay));
}

void PacingEngine::prune(DomainPacing& state, time_point now) const {
    while (!state.sends.empty() && state.sends.front() <= now - kHourWindow) {
        state.sends.pop_front();
    }
}

// Earliest send at or after `send` that keeps fewer than `cap` sends inside
// any `window`. Reserved sends are monotonic, so only the cap-th from the
// back can bind.
PacingEngine::time_point PacingEngine::apply_cap(const DomainPacing& state, time_point send,
                                                 int cap, Duration window) {
    size_t limit = static_cast<size_t>(cap);
    if (state.sends.size() < limit) {
        return send;
    }
    time_point earliest = state.sends[state.sends.size() - limit] + window + kRateSlack;
    return std::max(send, earliest);
}
