#pragma once

#include <stdexcept>
#include <string>

namespace temporal_update {

class TemporalUpdateError : public std::runtime_error {
public:
    explicit TemporalUpdateError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TemporalUpdateError {
public:
    explicit ConfigError(const std::string& message)
        : TemporalUpdateError("Config error: " + message) {}
};

class ValidationError : public TemporalUpdateError {
public:
    explicit ValidationError(const std::string& message)
        : TemporalUpdateError("Validation error: " + message) {}
};

class IOError : public TemporalUpdateError {
public:
    explicit IOError(const std::string& message)
        : TemporalUpdateError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Failure inside a per-component solver; aborts the whole update call.
class SolverError : public TemporalUpdateError {
public:
    SolverError(int component, const std::string& method, const std::string& message)
        : TemporalUpdateError("Solver error (" + method + ", component " +
                              std::to_string(component) + "): " + message),
          component_(component),
          method_(method) {}

    int component() const { return component_; }
    const std::string& method() const { return method_; }

private:
    int component_;
    std::string method_;
};

} // namespace temporal_update
