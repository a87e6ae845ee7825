#pragma once
#include "random_source.hpp"
#include "types.hpp"
#include <mutex>
#include <string>
#include <vector>

// Supplies fresh fingerprints to SessionManager::rotate.
class IdentityPool {
public:
    virtual ~IdentityPool() = default;
    virtual Fingerprint next_fingerprint() = 0;
};

// Draws user agents from a fixed profile list, never handing out the same
// agent twice in a row when more than one is available.
class ProfileIdentityPool : public IdentityPool {
public:
    ProfileIdentityPool(std::vector<std::string> user_agents, RandomSource& random);

    Fingerprint next_fingerprint() override;

private:
    std::vector<std::string> user_agents_;
    RandomSource& random_;
    std::mutex mutex_;
    size_t last_index_;
};
