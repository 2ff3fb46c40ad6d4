#ifndef OPTIMACH_ERRORS_HPP
#define OPTIMACH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace optimach {

// Invalid analysis input: horizon, interest rate, negative costs or salvage,
// schedules that do not cover the years a strategy needs.
// Raised before any strategy is evaluated.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Keep-duration k requested outside the range the parameters allow.
class StrategyRangeError : public std::out_of_range {
public:
    explicit StrategyRangeError(const std::string& message)
        : std::out_of_range(message) {}
};

// Analysis file or schedule CSV could not be read or parsed.
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace optimach

#endif // OPTIMACH_ERRORS_HPP
