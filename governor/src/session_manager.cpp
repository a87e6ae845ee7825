#include "session_manager.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Active: return "active";
        case SessionState::Expiring: return "expiring";
        case SessionState::Retired: return "retired";
    }
    return "unknown";
}

SessionManager::SessionManager(const Config& config, IdentityPool& identities,
                               RandomSource& random, const Clock& clock)
    : config_(config), identities_(identities), random_(random), clock_(clock) {}

SessionPtr SessionManager::acquire(const std::string& domain) {
    return slots_.with(domain, [&](Slot& slot) { return acquire_locked(domain, slot); });
}

bool SessionManager::should_rotate(Session& session, const Policy& policy) const {
    bool exhausted = session.request_count.load() >= policy.max_requests_per_session;

    auto jitter = std::chrono::duration_cast<Duration>(
        policy.session_renewal_jitter * session.renewal_fraction);
    auto lifetime = policy.max_session_duration - jitter;
    auto age = std::chrono::duration_cast<Duration>(clock_.now() - session.created_at);
    bool expired = age >= lifetime;

    if (!exhausted && !expired) {
        return false;
    }

    SessionState expected = SessionState::Active;
    if (session.state.compare_exchange_strong(expected, SessionState::Expiring)) {
        spdlog::debug("Session {} for {} expiring after {} requests, age {}s",
                      session.id, session.domain, session.request_count.load(),
                      util::ms_to_seconds(age));
    }
    return true;
}

SessionPtr SessionManager::rotate(const std::string& domain) {
    return slots_.with(domain, [&](Slot& slot) { return rotate_locked(domain, slot); });
}

SessionPtr SessionManager::rotate_if_current(const std::string& domain, const std::string& session_id) {
    return slots_.with(domain, [&](Slot& slot) -> SessionPtr {
        if (!slot.active || slot.active->id != session_id) {
            spdlog::debug("Skipping rotation for {}: session {} already replaced", domain, session_id);
            return nullptr;
        }
        return rotate_locked(domain, slot);
    });
}

int SessionManager::record_request(Session& session) {
    return session.request_count.fetch_add(1) + 1;
}

SessionPtr SessionManager::checkout(const std::string& domain, const Policy& policy) {
    return slots_.with(domain, [&](Slot& slot) {
        SessionPtr session = acquire_locked(domain, slot);
        if (should_rotate(*session, policy)) {
            session = rotate_locked(domain, slot);
        }
        record_request(*session);
        return session;
    });
}

SessionPtr SessionManager::current(const std::string& domain) {
    SessionPtr session;
    slots_.with_existing(domain, [&](Slot& slot) { session = slot.active; });
    return session;
}

SessionPtr SessionManager::acquire_locked(const std::string& domain, Slot& slot) {
    if (!slot.active || slot.active->state.load() == SessionState::Retired) {
        const Fingerprint* previous = slot.active ? &slot.active->fingerprint : nullptr;
        return create_session(domain, slot, previous);
    }
    return slot.active;
}

SessionPtr SessionManager::rotate_locked(const std::string& domain, Slot& slot) {
    SessionPtr old = slot.active;
    if (old) {
        old->state.store(SessionState::Retired);
    }

    SessionPtr fresh = create_session(domain, slot, old ? &old->fingerprint : nullptr);
    if (old) {
        spdlog::info("Rotated session for {}: {} ({} requests) -> {}",
                     domain, old->id, old->request_count.load(), fresh->id);
    }
    return fresh;
}

SessionPtr SessionManager::create_session(const std::string& domain, Slot& slot, const Fingerprint* previous) {
    auto session = std::make_shared<Session>();
    session->id = util::generate_uuid();
    session->domain = domain;
    session->generation = ++slot.generation;
    session->created_at = clock_.now();
    session->renewal_fraction = random_.uniform(0.0, 1.0);

    bool new_profile = config_.security.enable_profile_rotation && config_.session_fingerprint_rotation;
    if (previous && !new_profile) {
        session->fingerprint = *previous;
    } else {
        session->fingerprint = identities_.next_fingerprint();
    }

    if (config_.cookie_persistence) {
        session->cookie_jar = fmt::format("jar-{}-{}", domain, session->generation);
    }

    slot.active = session;
    spdlog::debug("New session {} for {} (generation {}, agent '{}')",
                  session->id, domain, session->generation, session->fingerprint.user_agent);
    return session;
}
