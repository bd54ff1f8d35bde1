#pragma once
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "../hw/ienv_sensor.hpp"
#include <exception>
#include <string>

/**
 * @brief Captures one Sample from an explicitly passed sensor capability
 *
 * Queries, in fixed order, the wall clock, pressure, temperature from
 * pressure, humidity and temperature from humidity. The four hardware reads
 * form one logical snapshot; no retries are made between them. Sentinel
 * values reported by the device (NaN, inf) are passed through untouched.
 */
struct SensorReader {
  IEnvSensor& sensor;     ///< Sensor capability, initialized by the caller
  const WallClock& clock; ///< Timestamp source

  /**
   * @brief Take one snapshot
   * @return Fully populated sample
   * @throws SensorUnavailable if the capability is not initialized or any
   *         read cannot reach the device
   */
  Sample capture() {
    if (!sensor.is_initialized()) {
      throw SensorUnavailable(sensor.get_type_name() + " " + sensor.get_id() + " is not initialized");
    }
    sensor.settle();

    Sample s;
    s.captured_at = clock.now_seconds();
    s.pressure = read("pressure", &IEnvSensor::read_pressure);
    s.temperature_from_pressure = read("temperature_from_pressure", &IEnvSensor::read_temperature_from_pressure);
    s.humidity = read("humidity", &IEnvSensor::read_humidity);
    s.temperature_from_humidity = read("temperature_from_humidity", &IEnvSensor::read_temperature_from_humidity);
    return s;
  }

private:
  double read(const char* what, double (IEnvSensor::*fn)()) {
    try {
      return (sensor.*fn)();
    } catch (const std::exception& e) {
      throw SensorUnavailable(std::string("reading ") + what + ": " + e.what());
    }
  }
};
