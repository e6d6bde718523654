#pragma once

#include <stdexcept>
#include <string>

namespace rangefetch {

// DNS, TCP, TLS and receive failures reported by the connector.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// Raised by the process* calls when a known API host answers 403.
class RateLimitError : public std::runtime_error {
public:
    explicit RateLimitError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace rangefetch
