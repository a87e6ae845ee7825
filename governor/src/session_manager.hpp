#pragma once
#include "clock.hpp"
#include "config.hpp"
#include "domain_table.hpp"
#include "identity_pool.hpp"
#include "random_source.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <string>

enum class SessionState {
    Active,
    Expiring,
    Retired
};

const char* to_string(SessionState state);

struct Session {
    std::string id;
    std::string domain;
    Fingerprint fingerprint;
    // Key of the caller-owned cookie jar; empty when cookies are not persisted
    std::string cookie_jar;
    int generation = 0;
    std::chrono::steady_clock::time_point created_at;
    // Fraction of session_renewal_jitter subtracted from max_session_duration
    double renewal_fraction = 0.0;

    std::atomic<int> request_count{0};
    std::atomic<SessionState> state{SessionState::Active};
};

using SessionPtr = std::shared_ptr<Session>;

class SessionManager {
public:
    SessionManager(const Config& config, IdentityPool& identities, RandomSource& random, const Clock& clock);

    // Active session for the domain, created when missing or retired
    SessionPtr acquire(const std::string& domain);

    // True once the session reached its request or age limit; marks it Expiring
    bool should_rotate(Session& session, const Policy& policy) const;

    // Retires the active session and installs a fresh one
    SessionPtr rotate(const std::string& domain);

    // Rotates only when `session_id` is still the active session, so several
    // reports about one ban replace it once. Returns nullptr when stale.
    SessionPtr rotate_if_current(const std::string& domain, const std::string& session_id);

    // Returns the new request count
    int record_request(Session& session);

    // acquire + should_rotate + rotate + record_request under one domain lock
    SessionPtr checkout(const std::string& domain, const Policy& policy);

    // Active session or nullptr, without creating one
    SessionPtr current(const std::string& domain);

private:
    struct Slot {
        SessionPtr active;
        int generation = 0;
    };

    SessionPtr acquire_locked(const std::string& domain, Slot& slot);
    SessionPtr rotate_locked(const std::string& domain, Slot& slot);
    SessionPtr create_session(const std::string& domain, Slot& slot, const Fingerprint* previous);

    const Config& config_;
    IdentityPool& identities_;
    RandomSource& random_;
    const Clock& clock_;
    DomainTable<Slot> slots_;
};
