#pragma once
#include <stdexcept>
#include <string>

// Malformed or out-of-order candle. Recoverable: the candle is skipped.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Ledger/detector logic violation. Aborts the current run.
class StateError : public std::runtime_error {
public:
    explicit StateError(const std::string& msg) : std::runtime_error(msg) {}
};

class PositionAlreadyOpen : public StateError {
public:
    explicit PositionAlreadyOpen(const std::string& msg) : StateError(msg) {}
};

class NoOpenPosition : public StateError {
public:
    explicit NoOpenPosition(const std::string& msg) : StateError(msg) {}
};

// Invalid configuration. Fatal at startup, never clamped.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Market data fetch failed (transport, timeout, HTTP status, payload).
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& msg) : std::runtime_error(msg) {}
};
