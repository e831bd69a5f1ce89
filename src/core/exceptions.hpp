#pragma once

#include <stdexcept>
#include <string>

namespace xarb {

class XarbException : public std::runtime_error {
public:
    explicit XarbException(const std::string& message) : std::runtime_error(message) {}
    explicit XarbException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public XarbException {
public:
    explicit ConfigurationError(const std::string& message)
        : XarbException("Configuration Error: " + message) {}
};

class DatabaseError : public XarbException {
public:
    explicit DatabaseError(const std::string& message)
        : XarbException("Database Error: " + message) {}
};

class TradingError : public XarbException {
public:
    explicit TradingError(const std::string& message)
        : XarbException("Trading Error: " + message) {}
};

// Ledger corruption or API misuse. Never caught inside the core.
class LedgerInvariantError : public std::logic_error {
public:
    explicit LedgerInvariantError(const std::string& message)
        : std::logic_error("Ledger invariant violated: " + message) {}
};

} // namespace xarb
