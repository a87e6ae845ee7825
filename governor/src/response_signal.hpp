#pragma once
#include "types.hpp"
#include <map>
#include <optional>
#include <string>

// What the governor sees of an HTTP response: never the full body.
struct ResponseSignal {
    static constexpr size_t kMaxExcerpt = 4096;

    int status = 0;
    std::string body_excerpt;
    std::optional<Duration> retry_after;
    bool captcha_challenge = false;

    // Builds a signal from a raw response. Header names are matched
    // case-insensitively; Retry-After is read as delta-seconds.
    static ResponseSignal from_http(int status,
                                    const std::map<std::string, std::string>& headers,
                                    const std::string& body);

    // Transport failure before any response arrived
    static ResponseSignal transport_error();

    bool ok() const { return status >= 200 && status < 400; }
};

// Parses a Retry-After value in delta-seconds; HTTP-date values are not supported
std::optional<Duration> parse_retry_after(const std::string& value);
