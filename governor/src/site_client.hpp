#pragma once
#include "config.hpp"
#include "response_signal.hpp"
#include "session_manager.hpp"
#include <cpr/cpr.h>
#include <mutex>
#include <string>
#include <unordered_map>

// Performs the actual GET for the probe and turns the response into a
// ResponseSignal. Cookie jars are keyed by Session::cookie_jar.
class SiteClient {
public:
    explicit SiteClient(const Config& config);

    ResponseSignal fetch(const std::string& url, const Session& session);

private:
    cpr::Header headers_for(const Session& session) const;
    cpr::Cookies jar_for(const std::string& key);
    void store_cookies(const std::string& key, const cpr::Cookies& cookies);

    const Config& config_;
    std::mutex jars_mutex_;
    std::unordered_map<std::string, cpr::Cookies> jars_;
};
