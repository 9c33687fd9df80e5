#pragma once

#include <stdexcept>
#include <string>

namespace gauge_adjust {

class GaugeAdjustError : public std::runtime_error {
public:
    explicit GaugeAdjustError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public GaugeAdjustError {
public:
    explicit ConfigurationError(const std::string& message)
        : GaugeAdjustError("Configuration error: " + message) {}
};

// Value vector length disagrees with its coordinate set
class ShapeMismatch : public GaugeAdjustError {
public:
    explicit ShapeMismatch(const std::string& message)
        : GaugeAdjustError("Shape mismatch: " + message) {}
};

class InvalidInput : public GaugeAdjustError {
public:
    explicit InvalidInput(const std::string& message)
        : GaugeAdjustError("Invalid input: " + message) {}
};

class IOError : public GaugeAdjustError {
public:
    explicit IOError(const std::string& message)
        : GaugeAdjustError("I/O error: " + message) {}
};

} // namespace gauge_adjust
