#include "response_signal.hpp"
#include "util.hpp"
#include <cctype>
#include <stdexcept>

ResponseSignal ResponseSignal::from_http(int status,
                                         const std::map<std::string, std::string>& headers,
                                         const std::string& body) {
    ResponseSignal signal;
    signal.status = status;
    signal.body_excerpt = body.substr(0, kMaxExcerpt);

    for (const auto& [name, value] : headers) {
        if (util::to_lower(name) == "retry-after") {
            signal.retry_after = parse_retry_after(value);
            break;
        }
    }

    return signal;
}

ResponseSignal ResponseSignal::transport_error() {
    return ResponseSignal{};
}

std::optional<Duration> parse_retry_after(const std::string& value) {
    std::string trimmed = util::trim(value);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    for (char c : trimmed) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    try {
        return Duration(std::chrono::seconds(std::stoll(trimmed)));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
