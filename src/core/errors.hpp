#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Failure kinds surfaced by a sampling run
 *
 * Every failure is an exception derived from std::runtime_error so the
 * application can catch them in one place and map them to an exit status.
 */

/// Capture step could not obtain a reading from the sensor capability
struct SensorUnavailable : std::runtime_error {
  explicit SensorUnavailable(const std::string& what)
      : std::runtime_error("sensor unavailable: " + what) {}
};

/// Append step could not open, lock, write or sync the log target
struct IoError : std::runtime_error {
  explicit IoError(const std::string& what)
      : std::runtime_error("I/O error: " + what) {}
};

/// Configuration file or value rejected
struct ConfigError : std::runtime_error {
  std::string detail;  ///< Message without the "config error" prefix

  explicit ConfigError(const std::string& what)
      : std::runtime_error("config error: " + what), detail(what) {}
};
