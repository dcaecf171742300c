#pragma once

#include <stdexcept>
#include <string>

namespace arm_angle {

class ArmAngleError : public std::runtime_error {
public:
    explicit ArmAngleError(const std::string& message)
        : std::runtime_error(message) {}
};

// Fatal before any unit is touched: bad paths, missing tools, id collisions.
class ConfigError : public ArmAngleError {
public:
    explicit ConfigError(const std::string& message)
        : ArmAngleError("Config error: " + message) {}
};

class ValidationError : public ArmAngleError {
public:
    explicit ValidationError(const std::string& message)
        : ArmAngleError("Validation error: " + message) {}
};

class IOError : public ArmAngleError {
public:
    explicit IOError(const std::string& message)
        : ArmAngleError("I/O error: " + message) {}
};

// Raised inside a single unit/stage attempt; never escapes the unit boundary.
class StageError : public ArmAngleError {
public:
    explicit StageError(const std::string& message)
        : ArmAngleError("Stage error: " + message) {}
};

class PipelineError : public ArmAngleError {
public:
    explicit PipelineError(const std::string& message)
        : ArmAngleError("Pipeline error: " + message) {}
};

} // namespace arm_angle
