#pragma once
#include <stdexcept>
#include <string>

namespace Glidepath {

// Malformed or out-of-range input. Raised before any simulation starts.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {}

    ValidationError(const std::string& scenario_id, const std::string& field, const std::string& reason)
        : std::invalid_argument("[Glidepath] scenario '" + scenario_id + "': " + field + ": " + reason),
          field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Malformed tax / RMD table, or a table lookup that cannot be satisfied.
// Fatal for the run.
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& msg) : std::runtime_error("[Glidepath] data error: " + msg) {}
};

// Cooperative cancellation between paths. Partial results are discarded.
class RunCancelled : public std::runtime_error {
public:
    explicit RunCancelled(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace Glidepath
