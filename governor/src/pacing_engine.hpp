#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "domain_table.hpp"
#include "random_source.hpp"
#include "session_manager.hpp"
#include "types.hpp"
#include <chrono>
#include <deque>
#include <string>

// Policy with the delay floors of `level` applied. Any level above Low
// switches to stealth pacing.
Policy adapt_to_threat(const Policy& policy, ThreatLevel level);

// A send time held in the domain's rate log until it slides out or is released
struct Reservation {
    Duration wait{0};
    Clock::time_point send_at{};
};

class PacingEngine {
public:
    static constexpr Duration kRateWindow{std::chrono::seconds(60)};
    static constexpr Duration kHourWindow{std::chrono::hours(1)};
    static constexpr double kAggressiveFactor = 0.5;
    static constexpr double kStealthFactor = 1.5;

    PacingEngine(const Config& config, RandomSource& random, const Clock& clock);

    // Delay the caller must wait before sending the next request on `session`.
    // Sends on a domain are spaced by the pacing delay from the last reserved
    // one, then held back by emergency waits and the minute and hour caps.
    Reservation reserve(const Session& session, const Policy& policy, ThreatLevel threat = ThreatLevel::Low);
    Duration next_delay(const Session& session, const Policy& policy);

    // Gives back a reservation whose request was never sent
    void release(const std::string& domain, Clock::time_point send_at);

    // Forced minimum wait for the domain; a longer pending wait is kept
    void note_emergency_delay(const std::string& domain, EmergencyKind kind, Duration duration);

    Duration emergency_delay_remaining(const std::string& domain);

    // Retry delay before attempt `attempt + 1`: base_delay doubled per attempt
    Duration backoff_delay(const Policy& policy, int attempt) const;

    // Send times reserved within the last minute (and hour)
    int requests_in_window(const std::string& domain);
    int requests_in_hour(const std::string& domain);

private:
    using time_point = Clock::time_point;

    // One log serves both caps: it holds the last hour of sends, and the
    // minute cap only looks at its tail.
    struct DomainPacing {
        std::deque<time_point> sends;
        time_point emergency_until{};
    };

    // Jitter-based delay, or a long pause when the Bernoulli draw fires
    Duration pacing_delay(const Policy& policy);
    void prune(DomainPacing& state, time_point now) const;
    static time_point apply_cap(const DomainPacing& state, time_point send, int cap, Duration window);

    const Config& config_;
    RandomSource& random_;
    const Clock& clock_;
    DomainTable<DomainPacing> pacing_;
};
