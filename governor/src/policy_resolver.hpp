#pragma once
#include "config.hpp"
#include "types.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

// Applies every field present in `ov` on top of `base`. Pure.
Policy overlay_policy(const Policy& base, const PolicyOverride& ov);

// Throws PolicyViolation when `policy` breaks an invariant
void validate_policy(const Policy& policy, const std::string& domain);

class PolicyResolver {
public:
    explicit PolicyResolver(const Config& config);

    // Effective policy for `domain`. Unknown domains get the global default.
    // Results are memoized; a violating override throws on every call.
    Policy resolve(const std::string& domain);

    bool has_override(const std::string& domain) const;

private:
    const PolicyOverride* find_override(const std::string& domain) const;

    const Config& config_;
    std::mutex mutex_;
    std::unordered_map<std::string, Policy> cache_;
};
