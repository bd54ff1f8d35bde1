#pragma once
#include "../config/config.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Malformed command line (exit status 2)
 */
struct UsageError : std::runtime_error {
  explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Flags given on the command line; unset fields leave the config alone
 */
struct CliOptions {
  bool help{false};
  bool init{false};
  bool simulate{false};
  bool fsync{false};
  bool lock{false};
  bool verbose{false};
  std::optional<std::string> output;
  std::optional<std::string> config_path;
  std::optional<std::string> i2c_bus;
  std::optional<std::string> lps25h_addr;
  std::optional<std::string> hts221_addr;
};

inline const char* usage_text() {
  return
    "usage: senselog [--init] [--output PATH|-] [--config FILE] [--i2c-bus DEV]\n"
    "                [--lps25h-addr ADDR] [--hts221-addr ADDR] [--simulate]\n"
    "                [--fsync] [--lock] [--verbose] [--help]\n"
    "\n"
    "Write one sensor record (time, pressure, temperature from pressure,\n"
    "humidity, temperature from humidity) to a tab-separated log.\n"
    "\n"
    "  --init              initialize sensors. Data are discarded.\n"
    "  --output PATH       log file (default records.tsv, '-' for stdout)\n"
    "  --config FILE       JSON config file (default $SENSELOG_CONFIG)\n"
    "  --i2c-bus DEV       I2C bus device (default /dev/i2c-1)\n"
    "  --lps25h-addr ADDR  LPS25H address (default 0x5c)\n"
    "  --hts221-addr ADDR  HTS221 address (default 0x5f)\n"
    "  --simulate          use the simulated sensor backend\n"
    "  --fsync             fsync the log after writing\n"
    "  --lock              hold an exclusive lock on the log while writing\n"
    "  --verbose           progress messages on stderr\n";
}

/**
 * @brief Parse argv (without the program name)
 *
 * Accepts "--flag value" and "--flag=value" for options taking a value.
 * @throws UsageError on unknown flags or missing values
 */
inline CliOptions parse_args(const std::vector<std::string>& args) {
  CliOptions opts;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    std::optional<std::string> inline_value;
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
    }

    auto take_value = [&]() -> std::string {
      if (inline_value) return *inline_value;
      if (i + 1 >= args.size()) {
        throw UsageError(arg + " requires a value");
      }
      return args[++i];
    };
    auto no_value = [&]() {
      if (inline_value) {
        throw UsageError(arg + " does not take a value");
      }
    };

    if (arg == "-h" || arg == "--help") { no_value(); opts.help = true; }
    else if (arg == "--init") { no_value(); opts.init = true; }
    else if (arg == "--simulate") { no_value(); opts.simulate = true; }
    else if (arg == "--fsync") { no_value(); opts.fsync = true; }
    else if (arg == "--lock") { no_value(); opts.lock = true; }
    else if (arg == "-v" || arg == "--verbose") { no_value(); opts.verbose = true; }
    else if (arg == "-o" || arg == "--output") opts.output = take_value();
    else if (arg == "--config") opts.config_path = take_value();
    else if (arg == "--i2c-bus") opts.i2c_bus = take_value();
    else if (arg == "--lps25h-addr") opts.lps25h_addr = take_value();
    else if (arg == "--hts221-addr") opts.hts221_addr = take_value();
    else throw UsageError("unknown argument: " + arg);
  }
  return opts;
}

/**
 * @brief Layer defaults, config file, environment and flags into a Config
 * @param cli Parsed flags
 * @param env_config Value of SENSELOG_CONFIG, or nullptr
 * @param env_output Value of SENSELOG_OUTPUT, or nullptr
 * @throws ConfigError on invalid file contents or values
 */
inline Config resolve_config(const CliOptions& cli, const char* env_config, const char* env_output) {
  Config cfg;

  if (cli.config_path) {
    cfg.merge_file(*cli.config_path);
  } else if (env_config && *env_config) {
    cfg.merge_file(env_config);
  }

  if (env_output && *env_output) {
    cfg.output = env_output;
  }

  if (cli.output) cfg.output = *cli.output;
  if (cli.i2c_bus) cfg.i2c_bus = *cli.i2c_bus;
  if (cli.lps25h_addr) cfg.lps25h_addr = Config::parse_address(*cli.lps25h_addr, "--lps25h-addr");
  if (cli.hts221_addr) cfg.hts221_addr = Config::parse_address(*cli.hts221_addr, "--hts221-addr");
  if (cli.simulate) cfg.backend = "simulated";
  if (cli.fsync) cfg.fsync = true;
  if (cli.lock) cfg.lock = true;
  if (cli.verbose) cfg.verbose = true;
  cfg.init_only = cli.init;

  cfg.validate();
  return cfg;
}
