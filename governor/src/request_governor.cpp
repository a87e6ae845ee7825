#include "request_governor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

const char* to_string(AdmitStatus status) {
    switch (status) {
        case AdmitStatus::Admitted: return "admitted";
        case AdmitStatus::CircuitOpen: return "circuit_open";
    }
    return "unknown";
}

const char* to_string(WaitResult result) {
    switch (result) {
        case WaitResult::Elapsed: return "elapsed";
        case WaitResult::Cancelled: return "cancelled";
        case WaitResult::DeadlineExceeded: return "deadline_exceeded";
    }
    return "unknown";
}

nlohmann::json DomainStats::to_json() const {
    return nlohmann::json{
        {"domain", domain},
        {"circuit", to_string(circuit)},
        {"healthy", healthy},
        {"success_rate", success_rate},
        {"consecutive_failures", consecutive_failures},
        {"session", {
            {"id", session_id},
            {"generation", session_generation},
            {"requests", session_requests}
        }},
        {"requests_last_minute", requests_last_minute},
        {"requests_last_hour", requests_last_hour},
        {"threat_level", to_string(threat)},
        {"emergency_delay_remaining", util::ms_to_seconds(emergency_delay_remaining)},
        {"generated_at", util::current_iso8601()}
    };
}

RequestGovernor::RequestGovernor(const Config& config,
                                 PolicyResolver& resolver,
                                 SessionManager& sessions,
                                 PacingEngine& pacing,
                                 FailureMonitor& failures,
                                 BanDetector& detector)
    : config_(config),
      resolver_(resolver),
      sessions_(sessions),
      pacing_(pacing),
      failures_(failures),
      detector_(detector) {}

Admission RequestGovernor::admit(const std::string& domain) {
    Admission admission;
    admission.domain = util::to_lower(domain);
    admission.policy = resolver_.resolve(admission.domain);

    CircuitGate gate = failures_.try_admit(admission.domain, admission.policy);
    if (!gate.admitted) {
        admission.status = AdmitStatus::CircuitOpen;
        admission.retry_in = gate.retry_in;
        spdlog::debug("Rejected request to {}: circuit {}, retry in {}s",
                      admission.domain, to_string(gate.state), util::ms_to_seconds(gate.retry_in));
        return admission;
    }

    admission.trial = gate.trial;
    admission.threat = failures_.threat_level(admission.domain);
    admission.session = sessions_.checkout(admission.domain, admission.policy);

    Reservation reservation = pacing_.reserve(*admission.session, admission.policy, admission.threat);
    admission.wait = reservation.wait;
    admission.send_at = reservation.send_at;

    spdlog::debug("Admitted request to {} on session {} (#{}), wait {}s, threat {}",
                  admission.domain, admission.session->id, admission.session->request_count.load(),
                  util::ms_to_seconds(admission.wait), to_string(admission.threat));
    return admission;
}

WaitResult RequestGovernor::wait(const Admission& admission, CancelToken& token,
                                 std::optional<std::chrono::steady_clock::time_point> deadline) {
    if (token.cancelled()) {
        return abandon_wait(admission, WaitResult::Cancelled);
    }

    auto ready_at = std::chrono::steady_clock::now() + admission.wait;
    if (deadline && *deadline < ready_at) {
        spdlog::debug("Abandoning request to {}: send time is past the caller deadline", admission.domain);
        return abandon_wait(admission, WaitResult::DeadlineExceeded);
    }

    if (!token.sleep_until(ready_at)) {
        return abandon_wait(admission, WaitResult::Cancelled);
    }
    return WaitResult::Elapsed;
}

WaitResult RequestGovernor::abandon_wait(const Admission& admission, WaitResult result) {
    if (admission.admitted() && admission.session) {
        pacing_.release(admission.domain, admission.send_at);
    }
    return result;
}

ReportResult RequestGovernor::report(const std::string& domain,
                                     const SessionPtr& session,
                                     const Outcome& outcome,
                                     const ResponseSignal& signal) {
    std::string key = util::to_lower(domain);
    Policy policy = resolver_.resolve(key);

    ReportResult result;
    result.retry = failures_.report(key, outcome, policy);

    auto event = detector_.inspect(key, signal, policy);
    if (event) {
        handle_emergency(*event, session, result);
        result.event = std::move(event);
    }

    return result;
}

DomainStats RequestGovernor::stats(const std::string& domain) {
    std::string key = util::to_lower(domain);
    Policy policy = resolver_.resolve(key);

    DomainStats stats;
    stats.domain = key;
    stats.circuit = failures_.circuit_state(key);
    stats.healthy = failures_.is_healthy(key, policy);
    stats.success_rate = failures_.success_rate(key);
    stats.consecutive_failures = failures_.consecutive_failures(key);
    stats.requests_last_minute = pacing_.requests_in_window(key);
    stats.requests_last_hour = pacing_.requests_in_hour(key);
    stats.threat = failures_.threat_level(key);
    stats.emergency_delay_remaining = pacing_.emergency_delay_remaining(key);

    if (SessionPtr session = sessions_.current(key)) {
        stats.session_id = session->id;
        stats.session_generation = session->generation;
        stats.session_requests = session->request_count.load();
    }

    return stats;
}

void RequestGovernor::handle_emergency(const EmergencyEvent& event, const SessionPtr& session, ReportResult& result) {
    spdlog::warn("Emergency escalation for {}: {} -> {}, forced delay {}s",
                 event.domain, to_string(event.kind), to_string(event.action),
                 util::ms_to_seconds(event.forced_delay));

    switch (event.action) {
        case EmergencyAction::SwitchProxyAndDelay:
            result.rotated = rotate_for_emergency(event.domain, session);
            pacing_.note_emergency_delay(event.domain, event.kind, event.forced_delay);
            if (config_.security.enable_proxy_rotation) {
                result.switch_proxy = true;
            } else {
                spdlog::info("Proxy rotation disabled, keeping current route for {}", event.domain);
            }
            break;

        case EmergencyAction::LongDelayAndProfileChange:
            result.rotated = rotate_for_emergency(event.domain, session);
            pacing_.note_emergency_delay(event.domain, event.kind, event.forced_delay);
            break;

        case EmergencyAction::Backoff:
            pacing_.note_emergency_delay(event.domain, event.kind, event.forced_delay);
            break;
    }
}

bool RequestGovernor::rotate_for_emergency(const std::string& domain, const SessionPtr& session) {
    if (!session) {
        sessions_.rotate(domain);
        return true;
    }
    return sessions_.rotate_if_current(domain, session->id) != nullptr;
}
