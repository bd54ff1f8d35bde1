#pragma once
#include "cli.hpp"
#include "../config/config.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/sample.hpp"
#include "../hw/ienv_sensor.hpp"
#include "../hw/sense_hat.hpp"
#include "../hw/sim_env_sensor.hpp"
#include "../sampling/sensor_reader.hpp"
#include "../storage/record_appender.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Terminal outcome of a successful run
 */
enum class RunOutcome {
  DISCARDED,  ///< Init-only mode: sample captured, nothing written
  APPENDED    ///< Normal mode: exactly one line appended
};

struct RunResult {
  Sample sample;
  RunOutcome outcome{RunOutcome::DISCARDED};
  std::size_t bytes_written{0};
};

/**
 * @brief Build the sensor capability selected by the configuration
 */
inline std::unique_ptr<IEnvSensor> make_sensor(const Config& cfg) {
  if (cfg.backend == "simulated") {
    return std::make_unique<SimulatedEnvSensor>();
  }
  return std::make_unique<SenseHat>(cfg.i2c_bus, cfg.lps25h_addr, cfg.hts221_addr,
                                    std::chrono::milliseconds(cfg.settle_ms));
}

/**
 * @brief One capture + append (or discard) cycle
 *
 * A failure at either step throws and short-circuits the rest, so a failed
 * capture never touches the log.
 */
struct Sampler {
  IEnvSensor& sensor;
  const WallClock& clock;
  const Config& cfg;
  std::ostream& log;

  RunResult run() {
    if (!sensor.is_initialized()) {
      if (cfg.verbose) {
        log << "Initializing " << sensor.get_type_name() << " (" << sensor.get_id() << ")" << std::endl;
      }
      if (!sensor.initialize()) {
        throw SensorUnavailable("failed to initialize " + sensor.get_type_name() + ": " +
                                IEnvSensor::error_to_string(sensor.get_last_error()) + " " +
                                sensor.get_last_error_message());
      }
    }

    if (cfg.verbose) {
      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(sensor.time_to_ready());
      log << "Waiting " << wait.count() << " ms for " << sensor.get_type_name() << " to settle" << std::endl;
    }

    SensorReader reader{sensor, clock};
    RunResult result;
    result.sample = reader.capture();
    if (cfg.verbose) {
      log << "Captured " << result.sample.to_string() << std::endl;
    }
    if (!result.sample.all_finite()) {
      log << "Warning: sample contains non-finite readings, recorded as-is" << std::endl;
    }

    RecordAppender appender(AppendOptions{cfg.fsync, cfg.lock});
    if (cfg.init_only) {
      appender.discard(result.sample);
      result.outcome = RunOutcome::DISCARDED;
      if (cfg.verbose) {
        log << "Init mode: sample discarded" << std::endl;
      }
      return result;
    }

    result.bytes_written = appender.append(result.sample, cfg.output);
    result.outcome = RunOutcome::APPENDED;
    if (cfg.verbose) {
      log << "Appended " << result.bytes_written << " bytes to " << cfg.output << std::endl;
    }
    return result;
  }
};

/**
 * @brief Full command: parse, configure, sample, map failures to exit status
 * @param args argv without the program name
 * @param env_config Value of SENSELOG_CONFIG, or nullptr
 * @param env_output Value of SENSELOG_OUTPUT, or nullptr
 * @param out Stream for --help output
 * @param err Stream for diagnostics
 * @return 0 on success, 1 on sensor/I/O/config failure, 2 on usage error
 */
inline int run_command(const std::vector<std::string>& args,
                       const char* env_config,
                       const char* env_output,
                       std::ostream& out,
                       std::ostream& err) {
  CliOptions cli;
  try {
    cli = parse_args(args);
  } catch (const UsageError& e) {
    err << "senselog: " << e.what() << "\n" << usage_text();
    return 2;
  }
  if (cli.help) {
    out << usage_text();
    return 0;
  }

  try {
    Config cfg = resolve_config(cli, env_config, env_output);
    if (cfg.verbose) {
      err << "Configuration: " << cfg.to_json().dump() << std::endl;
    }

    auto sensor = make_sensor(cfg);
    SystemWallClock clock;
    Sampler sampler{*sensor, clock, cfg, err};
    sampler.run();
    // Sensors are left powered on between runs.
    return 0;
  } catch (const std::exception& e) {
    err << "senselog: " << e.what() << std::endl;
    return 1;
  }
}
