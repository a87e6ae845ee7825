#include "site_client.hpp"
#include <spdlog/spdlog.h>
#include <map>

SiteClient::SiteClient(const Config& config) : config_(config) {}

ResponseSignal SiteClient::fetch(const std::string& url, const Session& session) {
    cpr::Response response;
    try {
        if (session.cookie_jar.empty()) {
            response = cpr::Get(cpr::Url{url}, headers_for(session), cpr::Timeout{config_.request_timeout});
        } else {
            response = cpr::Get(cpr::Url{url}, headers_for(session), jar_for(session.cookie_jar),
                                cpr::Timeout{config_.request_timeout});
        }
    } catch (const std::exception& e) {
        spdlog::error("HTTP request to {} threw: {}", url, e.what());
        return ResponseSignal::transport_error();
    }

    if (response.error) {
        spdlog::warn("Transport error for {}: {}", url, response.error.message);
        return ResponseSignal::transport_error();
    }

    if (!session.cookie_jar.empty()) {
        store_cookies(session.cookie_jar, response.cookies);
    }

    std::map<std::string, std::string> headers(response.header.begin(), response.header.end());
    spdlog::debug("GET {} -> {} ({} bytes)", url, response.status_code, response.text.size());
    return ResponseSignal::from_http(static_cast<int>(response.status_code), headers, response.text);
}

cpr::Header SiteClient::headers_for(const Session& session) const {
    cpr::Header headers{
        {"User-Agent", session.fingerprint.user_agent},
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Connection", "keep-alive"},
        {"Upgrade-Insecure-Requests", "1"}
    };

    if (config_.evasion.randomize_headers) {
        // Optional headers follow the session's seed so they stay stable per identity
        uint64_t seed = session.fingerprint.header_order_seed;
        if (seed % 10 < 3) {
            headers["DNT"] = "1";
        }
        if ((seed / 10) % 10 < 2) {
            headers["Sec-GPC"] = "1";
        }
    }

    return headers;
}

cpr::Cookies SiteClient::jar_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(jars_mutex_);
    return jars_[key];
}

void SiteClient::store_cookies(const std::string& key, const cpr::Cookies& cookies) {
    std::lock_guard<std::mutex> lock(jars_mutex_);
    auto& jar = jars_[key];

    // Newer values replace cookies of the same name
    cpr::Cookies merged;
    for (const auto& existing : jar) {
        bool replaced = false;
        for (const auto& cookie : cookies) {
            if (cookie.GetName() == existing.GetName()) {
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            merged.push_back(existing);
        }
    }
    for (const auto& cookie : cookies) {
        merged.push_back(cookie);
    }
    jar = merged;
}
