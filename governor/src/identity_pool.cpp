#include "identity_pool.hpp"
#include "errors.hpp"
#include <algorithm>

ProfileIdentityPool::ProfileIdentityPool(std::vector<std::string> user_agents, RandomSource& random)
    : user_agents_(std::move(user_agents)),
      random_(random),
      last_index_(user_agents_.size()) {
    if (user_agents_.empty()) {
        throw ConfigError("Identity pool needs at least one user agent");
    }
}

Fingerprint ProfileIdentityPool::next_fingerprint() {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = user_agents_.size();
    auto index = static_cast<size_t>(random_.uniform(0.0, static_cast<double>(count)));
    index = std::min(index, count - 1);
    if (count > 1 && index == last_index_) {
        index = (index + 1) % count;
    }
    last_index_ = index;

    Fingerprint fp;
    fp.user_agent = user_agents_[index];
    fp.header_order_seed = random_.next_seed();
    fp.tls_profile_seed = random_.next_seed();
    return fp;
}
