#pragma once
#include "../core/errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Runtime configuration for one sampling run
 *
 * Built from defaults, then an optional JSON file, then the environment,
 * then command-line flags. Only the keys present in a layer override the
 * layer below; unknown keys are ignored.
 *
 * File format:
 * {"output":"records.tsv","backend":"sense_hat","i2c_bus":"/dev/i2c-1",
 *  "lps25h_addr":"0x5c","hts221_addr":"0x5f","settle_ms":50,
 *  "fsync":false,"lock":false,"verbose":false}
 */
struct Config {
  std::string output{"records.tsv"};  ///< Log path, "-" for stdout
  std::string backend{"sense_hat"};   ///< "sense_hat" or "simulated"
  std::string i2c_bus{"/dev/i2c-1"};  ///< Bus device node
  std::uint16_t lps25h_addr{0x5c};    ///< Pressure sensor slave address
  std::uint16_t hts221_addr{0x5f};    ///< Humidity sensor slave address
  int settle_ms{50};                  ///< Delay after power-on before reading
  bool fsync{false};                  ///< fsync after append
  bool lock{false};                   ///< flock the log during append
  bool verbose{false};                ///< Progress messages on stderr
  bool init_only{false};              ///< Capture and discard (command line only)

  static constexpr int MAX_SETTLE_MS = 60000;

  /**
   * @brief Parse an I2C address given as decimal or 0x-prefixed hex
   * @throws ConfigError if malformed or outside the 7-bit range 0x03..0x77
   */
  static std::uint16_t parse_address(const std::string& text, const std::string& key) {
    if (text.empty()) {
      throw ConfigError(key + ": empty address");
    }
    char* end = nullptr;
    unsigned long v = std::strtoul(text.c_str(), &end, 0);
    if (end == text.c_str() || *end != '\0') {
      throw ConfigError(key + ": not an address: '" + text + "'");
    }
    return check_address(v, key);
  }

  static std::uint16_t check_address(unsigned long v, const std::string& key) {
    if (v < 0x03 || v > 0x77) {
      throw ConfigError(key + ": address out of 7-bit range: " + std::to_string(v));
    }
    return static_cast<std::uint16_t>(v);
  }

  /**
   * @brief Overlay keys present in a JSON object onto this config
   * @throws ConfigError on wrong value types or values
   */
  void merge_json(const json& j) {
    if (!j.is_object()) {
      throw ConfigError("top level must be a JSON object");
    }
    output = get_string(j, "output", output);
    backend = get_string(j, "backend", backend);
    i2c_bus = get_string(j, "i2c_bus", i2c_bus);
    if (j.contains("lps25h_addr")) lps25h_addr = get_address(j, "lps25h_addr");
    if (j.contains("hts221_addr")) hts221_addr = get_address(j, "hts221_addr");
    if (j.contains("settle_ms")) {
      if (!j["settle_ms"].is_number_integer()) {
        throw ConfigError("settle_ms must be an integer");
      }
      long long ms = j["settle_ms"].get<long long>();
      if (ms < 0) {
        throw ConfigError("settle_ms must not be negative");
      }
      if (ms > MAX_SETTLE_MS) {
        throw ConfigError("settle_ms must be at most " + std::to_string(MAX_SETTLE_MS));
      }
      settle_ms = static_cast<int>(ms);
    }
    fsync = get_bool(j, "fsync", fsync);
    lock = get_bool(j, "lock", lock);
    verbose = get_bool(j, "verbose", verbose);
    validate();
  }

  /**
   * @brief Overlay the contents of a JSON config file
   * @throws ConfigError if the file cannot be read or parsed
   */
  void merge_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw ConfigError("cannot read " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
      throw ConfigError(path + ": invalid JSON");
    }
    try {
      merge_json(j);
    } catch (const ConfigError& e) {
      throw ConfigError(path + ": " + e.detail);
    }
  }

  /**
   * @brief Check cross-field invariants
   * @throws ConfigError on the first violated rule
   */
  void validate() const {
    if (output.empty()) {
      throw ConfigError("output path must not be empty");
    }
    if (backend != "sense_hat" && backend != "simulated") {
      throw ConfigError("unknown backend '" + backend + "' (expected sense_hat or simulated)");
    }
    if (backend == "sense_hat" && i2c_bus.empty()) {
      throw ConfigError("i2c_bus must not be empty");
    }
    if (settle_ms < 0 || settle_ms > MAX_SETTLE_MS) {
      throw ConfigError("settle_ms out of range 0.." + std::to_string(MAX_SETTLE_MS));
    }
  }

  json to_json() const {
    return {{"output", output}, {"backend", backend}, {"i2c_bus", i2c_bus},
            {"lps25h_addr", lps25h_addr}, {"hts221_addr", hts221_addr},
            {"settle_ms", settle_ms}, {"fsync", fsync}, {"lock", lock},
            {"verbose", verbose}, {"init_only", init_only}};
  }

private:
  static std::string get_string(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_string()) {
      throw ConfigError(std::string(key) + " must be a string");
    }
    return j[key].get<std::string>();
  }

  static bool get_bool(const json& j, const char* key, bool fallback) {
    if (!j.contains(key)) return fallback;
    if (!j[key].is_boolean()) {
      throw ConfigError(std::string(key) + " must be a boolean");
    }
    return j[key].get<bool>();
  }

  static std::uint16_t get_address(const json& j, const char* key) {
    const json& v = j[key];
    if (v.is_string()) {
      return parse_address(v.get<std::string>(), key);
    }
    if (v.is_number_integer()) {
      long long n = v.get<long long>();
      if (n < 0) {
        throw ConfigError(std::string(key) + ": address out of 7-bit range: " + std::to_string(n));
      }
      return check_address(static_cast<unsigned long>(n), key);
    }
    throw ConfigError(std::string(key) + " must be an integer or a string");
  }
};
