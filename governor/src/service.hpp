#pragma once

#include "ban_detector.hpp"
#include "cancel_token.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "failure_monitor.hpp"
#include "identity_pool.hpp"
#include "pacing_engine.hpp"
#include "policy_resolver.hpp"
#include "random_source.hpp"
#include "request_governor.hpp"
#include "session_manager.hpp"
#include "site_client.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Fetches a list of URLs on a few worker threads, every request going
// through the governor.
class Service {
public:
    explicit Service(const Config& config);

    // Returns the number of URLs fetched successfully
    int run(const std::vector<std::string>& urls);
    void stop();

private:
    bool fetch(const std::string& url);
    void worker_loop(const std::vector<std::string>& urls);
    void log_stats(const std::vector<std::string>& urls);

    const Config& config_;
    std::unique_ptr<RandomSource> random_;
    SteadyClock clock_;
    ProfileIdentityPool identities_;
    PolicyResolver resolver_;
    SessionManager sessions_;
    PacingEngine pacing_;
    FailureMonitor failures_;
    BanDetector detector_;
    RequestGovernor governor_;
    SiteClient client_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> next_url_{0};
    std::atomic<int> fetched_{0};
    CancelToken cancel_;
};
