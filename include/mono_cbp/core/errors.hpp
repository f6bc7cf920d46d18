#pragma once

#include <stdexcept>
#include <string>

namespace mono_cbp {

class MonoCbpError : public std::runtime_error {
public:
    explicit MonoCbpError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public MonoCbpError {
public:
    explicit ConfigError(const std::string& message)
        : MonoCbpError("Config error: " + message) {}
};

class ValidationError : public MonoCbpError {
public:
    explicit ValidationError(const std::string& message)
        : MonoCbpError("Validation error: " + message) {}
};

class IOError : public MonoCbpError {
public:
    explicit IOError(const std::string& message)
        : MonoCbpError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class PipelineError : public MonoCbpError {
public:
    explicit PipelineError(const std::string& message)
        : MonoCbpError("Pipeline error: " + message) {}
};

} // namespace mono_cbp
