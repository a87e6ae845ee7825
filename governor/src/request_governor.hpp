#pragma once
#include "ban_detector.hpp"
#include "cancel_token.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "failure_monitor.hpp"
#include "pacing_engine.hpp"
#include "policy_resolver.hpp"
#include "response_signal.hpp"
#include "session_manager.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

enum class AdmitStatus {
    Admitted,
    CircuitOpen
};

enum class WaitResult {
    Elapsed,
    Cancelled,
    DeadlineExceeded
};

const char* to_string(AdmitStatus status);
const char* to_string(WaitResult result);

struct Admission {
    AdmitStatus status = AdmitStatus::Admitted;
    std::string domain;
    Policy policy;
    SessionPtr session;
    // Delay to honor before sending
    Duration wait{0};
    // Reserved send time in the domain's rate log
    Clock::time_point send_at{};
    ThreatLevel threat = ThreatLevel::Low;
    // Half-open probe: its outcome decides the circuit
    bool trial = false;
    // Set when rejected: time until the breaker may admit a trial
    Duration retry_in{0};

    bool admitted() const { return status == AdmitStatus::Admitted; }
};

struct ReportResult {
    RetryDecision retry;
    std::optional<EmergencyEvent> event;
    // Caller should take a new proxy before the next request
    bool switch_proxy = false;
    bool rotated = false;
};

struct DomainStats {
    std::string domain;
    CircuitState circuit = CircuitState::Closed;
    bool healthy = true;
    double success_rate = 1.0;
    int consecutive_failures = 0;
    std::string session_id;
    int session_generation = 0;
    int session_requests = 0;
    int requests_last_minute = 0;
    int requests_last_hour = 0;
    ThreatLevel threat = ThreatLevel::Low;
    Duration emergency_delay_remaining{0};

    nlohmann::json to_json() const;
};

// Entry point for callers: admit() before each request, report() after it.
// Holds references only; all state lives in the components.
class RequestGovernor {
public:
    RequestGovernor(const Config& config,
                    PolicyResolver& resolver,
                    SessionManager& sessions,
                    PacingEngine& pacing,
                    FailureMonitor& failures,
                    BanDetector& detector);

    // Throws PolicyViolation when the domain's override is malformed
    Admission admit(const std::string& domain);

    // Waits out admission.wait with no lock held. Returns early on cancel,
    // and immediately when the send time would fall past `deadline`. A wait
    // that does not elapse gives its reserved send time back to the rate log.
    WaitResult wait(const Admission& admission, CancelToken& token,
                    std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    ReportResult report(const std::string& domain,
                        const SessionPtr& session,
                        const Outcome& outcome,
                        const ResponseSignal& signal);

    DomainStats stats(const std::string& domain);

private:
    void handle_emergency(const EmergencyEvent& event, const SessionPtr& session, ReportResult& result);
    bool rotate_for_emergency(const std::string& domain, const SessionPtr& session);
    WaitResult abandon_wait(const Admission& admission, WaitResult result);

    const Config& config_;
    PolicyResolver& resolver_;
    SessionManager& sessions_;
    PacingEngine& pacing_;
    FailureMonitor& failures_;
    BanDetector& detector_;
};
