#pragma once

#include <stdexcept>
#include <string>

namespace xarb {

// Raised by price feeds and order gateways for transport or venue failures.
class ExchangeException : public std::runtime_error {
public:
    explicit ExchangeException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace xarb
