#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "domain_table.hpp"
#include "pacing_engine.hpp"
#include "types.hpp"
#include <deque>
#include <string>

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

enum class RetryAction {
    None,
    RetryNow,
    RetryAfterBackoff,
    Abandon
};

enum class AbandonReason {
    None,
    CircuitOpen,
    RetryExhausted
};

const char* to_string(CircuitState state);
const char* to_string(RetryAction action);
const char* to_string(AbandonReason reason);

// Result of one network attempt as reported by the caller
struct Outcome {
    bool success = true;
    // 1 for the first try of a logical fetch, incremented per retry
    int attempt = 1;
    // Copied from Admission::trial; only the trial's report moves a half-open circuit
    bool trial = false;
};

struct RetryDecision {
    RetryAction action = RetryAction::None;
    AbandonReason reason = AbandonReason::None;
    Duration delay{0};
};

struct CircuitGate {
    bool admitted = true;
    bool trial = false;
    CircuitState state = CircuitState::Closed;
    Duration retry_in{0};
};

class FailureMonitor {
public:
    FailureMonitor(const Config& config, const PacingEngine& pacing, const Clock& clock);

    // Records the outcome and advances the circuit. Every call counts,
    // so reporting the same failure twice moves the streak by two.
    RetryDecision report(const std::string& domain, const Outcome& outcome, const Policy& policy);

    bool is_healthy(const std::string& domain, const Policy& policy);

    // Admission check against the circuit. Moves Open -> HalfOpen once the
    // recovery timeout has elapsed and lets exactly one trial through.
    CircuitGate try_admit(const std::string& domain, const Policy& policy);

    // Notes a CAPTCHA challenge; returns the sightings within the window horizon
    int record_captcha(const std::string& domain);

    // Notes a response that tripped a bot detector (ban page, CAPTCHA, 429)
    void record_detection(const std::string& domain);

    // Low until the window holds enough outcomes; then graded by the success
    // rate and the share of responses that tripped a detector.
    ThreatLevel threat_level(const std::string& domain);

    double success_rate(const std::string& domain);
    int consecutive_failures(const std::string& domain);
    CircuitState circuit_state(const std::string& domain);

private:
    using time_point = Clock::time_point;

    struct OutcomeRecord {
        bool success;
        time_point at;
    };

    struct DomainHealth {
        std::deque<OutcomeRecord> window;
        std::deque<time_point> captchas;
        std::deque<time_point> detections;
        ThreatLevel threat = ThreatLevel::Low;
        int consecutive_failures = 0;
        CircuitState circuit = CircuitState::Closed;
        time_point opened_at{};
        bool trial_in_flight = false;
        time_point trial_started{};
    };

    void trim(DomainHealth& health, time_point now) const;
    void open_circuit(const std::string& domain, DomainHealth& health, time_point now);
    void reassess(const std::string& domain, DomainHealth& health);
    static double rate_of(const DomainHealth& health);

    const Config& config_;
    const PacingEngine& pacing_;
    const Clock& clock_;
    DomainTable<DomainHealth> health_;
};
