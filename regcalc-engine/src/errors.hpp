#ifndef REGCALC_ERRORS_HPP
#define REGCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace regcalc {

// Malformed or out-of-domain input, rejected before any computation.
// field() names the first offending input.
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& field, const std::string& message)
        : std::runtime_error(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Internally inconsistent intermediate state (e.g. a correlation matrix
// that yields a negative quadratic form).
class ComputationError : public std::runtime_error {
public:
    explicit ComputationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Configuration could not be parsed or holds an invalid value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Per-item failure captured during portfolio aggregation
struct ItemFailure {
    std::string item_id;
    std::string message;
};

} // namespace regcalc

#endif // REGCALC_ERRORS_HPP
