#pragma once

#include <stdexcept>
#include <string>

namespace rankfolio {

// Invalid parameters detected before any computation starts
// (weights not summing to 1, N <= 0, band < 0, bad dates...).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Price data gap that makes a whole simulator run meaningless.
// Aborts that run only; callers such as the optimizer record it as a failure.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rankfolio
