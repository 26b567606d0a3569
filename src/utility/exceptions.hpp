#pragma once

#include <stdexcept>
#include <string>

namespace flock {

/**
 * Base exception class for all flock-related errors
 */
class FlockException : public std::runtime_error {
  public:
    explicit FlockException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for simulation-related errors (misuse of the step pipeline,
 * non-finite state)
 */
class SimulationError : public FlockException {
  public:
    explicit SimulationError(const std::string &message)
        : FlockException("Simulation error: " + message) {}
};

/**
 * Exception for rendering-related errors
 */
class RenderError : public FlockException {
  public:
    explicit RenderError(const std::string &message)
        : FlockException("Render error: " + message) {}
};

/**
 * Exception for I/O operations (file read/write, JSON parsing)
 */
class IOError : public FlockException {
  public:
    explicit IOError(const std::string &message)
        : FlockException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors, including a grid that is
 * too small for the agents it has to index
 */
class ConfigError : public FlockException {
  public:
    explicit ConfigError(const std::string &message)
        : FlockException("Configuration error: " + message) {}
};

} // namespace flock
