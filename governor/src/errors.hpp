#pragma once
#include <stdexcept>
#include <string>

// Malformed configuration document
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// A resolved policy that breaks one of its invariants (e.g. base_delay > max_delay)
class PolicyViolation : public std::runtime_error {
public:
    PolicyViolation(const std::string& domain, const std::string& what)
        : std::runtime_error("policy for '" + domain + "': " + what), domain_(domain) {}

    const std::string& domain() const { return domain_; }

private:
    std::string domain_;
};
