#include "service.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>
#include <thread>

namespace {

std::unique_ptr<RandomSource> make_random(const Config& config) {
    if (config.seed) {
        spdlog::info("Using fixed random seed {}", *config.seed);
        return std::make_unique<Mt19937Random>(*config.seed);
    }
    return std::make_unique<Mt19937Random>();
}

} // namespace

Service::Service(const Config& config)
    : config_(config),
      random_(make_random(config)),
      identities_(config.user_agents, *random_),
      resolver_(config),
      sessions_(config, identities_, *random_, clock_),
      pacing_(config, *random_, clock_),
      failures_(config, pacing_, clock_),
      detector_(config, failures_, *random_, clock_),
      governor_(config, resolver_, sessions_, pacing_, failures_, detector_),
      client_(config) {
}

int Service::run(const std::vector<std::string>& urls) {
    running_ = true;
    next_url_ = 0;
    fetched_ = 0;

    int workers = std::min<int>(config_.worker_threads, static_cast<int>(urls.size()));
    spdlog::info("Fetching {} URLs on {} workers", urls.size(), workers);

    std::vector<std::thread> threads;
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back(&Service::worker_loop, this, std::cref(urls));
    }
    for (auto& thread : threads) {
        thread.join();
    }

    log_stats(urls);
    running_ = false;
    return fetched_.load();
}

void Service::stop() {
    if (running_.exchange(false)) {
        spdlog::info("Stopping probe, cancelling pending waits...");
        cancel_.cancel();
    }
}

void Service::worker_loop(const std::vector<std::string>& urls) {
    while (running_) {
        size_t index = next_url_.fetch_add(1);
        if (index >= urls.size()) {
            break;
        }

        try {
            if (fetch(urls[index])) {
                fetched_++;
            }
        } catch (const PolicyViolation& e) {
            spdlog::error("Skipping {}: {}", urls[index], e.what());
        }
    }
}

bool Service::fetch(const std::string& url) {
    std::string domain = util::host_of(url);
    auto deadline = std::chrono::steady_clock::now() + config_.fetch_deadline;

    for (int attempt = 1; running_; ++attempt) {
        Admission admission = governor_.admit(domain);
        if (!admission.admitted()) {
            spdlog::warn("Skipping {}: circuit open for {}, retry in {}s",
                         url, domain, util::ms_to_seconds(admission.retry_in));
            return false;
        }

        if (attempt == 1 && (admission.policy.requires_javascript || admission.policy.requires_login)) {
            spdlog::info("{} needs {}; fetching raw HTML only", domain,
                         admission.policy.requires_login ? "a login" : "JavaScript rendering");
        }

        WaitResult waited = governor_.wait(admission, cancel_, deadline);
        if (waited != WaitResult::Elapsed) {
            spdlog::info("Not sending {}: wait {}", url, to_string(waited));
            return false;
        }

        ResponseSignal signal = client_.fetch(url, *admission.session);
        Outcome outcome;
        outcome.success = signal.ok();
        outcome.attempt = attempt;
        outcome.trial = admission.trial;

        ReportResult result = governor_.report(domain, admission.session, outcome, signal);
        if (result.switch_proxy) {
            spdlog::warn("Proxy switch requested for {}; no proxy source configured", domain);
        }

        if (outcome.success) {
            spdlog::info("Fetched {} ({})", url, signal.status);
            return true;
        }

        switch (result.retry.action) {
            case RetryAction::RetryNow:
                continue;
            case RetryAction::RetryAfterBackoff:
                spdlog::debug("Retrying {} in {}s (attempt {})", url,
                              util::ms_to_seconds(result.retry.delay), attempt + 1);
                if (!cancel_.sleep_until(std::chrono::steady_clock::now() + result.retry.delay)) {
                    return false;
                }
                continue;
            case RetryAction::Abandon:
                spdlog::warn("Abandoning {}: {}", url, to_string(result.retry.reason));
                return false;
            case RetryAction::None:
                return false;
        }
    }

    return false;
}

void Service::log_stats(const std::vector<std::string>& urls) {
    std::set<std::string> domains;
    for (const auto& url : urls) {
        domains.insert(util::host_of(url));
    }

    for (const auto& domain : domains) {
        try {
            spdlog::info("Stats: {}", governor_.stats(domain).to_json().dump());
        } catch (const PolicyViolation& e) {
            spdlog::warn("No stats for {}: {}", domain, e.what());
        }
    }
}
