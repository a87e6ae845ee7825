#pragma once
#include <string>
#include <chrono>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// Logging
void setup_logging(const std::string& level, const std::string& logger_name = "governor");

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

// Extracts the host part of a URL ("https://www.kenney.nl/assets" -> "www.kenney.nl")
std::string host_of(const std::string& url);

// Time utilities
std::string current_iso8601();
std::chrono::milliseconds seconds_to_ms(double seconds);
double ms_to_seconds(std::chrono::milliseconds ms);

// Random utilities
std::string generate_uuid();

} // namespace util
