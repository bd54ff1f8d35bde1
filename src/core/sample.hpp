#pragma once
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

/**
 * @brief One environmental snapshot taken during a sampling run
 *
 * Created fresh on every invocation and owned by that run only. Only the
 * serialized record line ever outlives the process.
 */
struct Sample {
    double captured_at;                ///< Wall-clock seconds since the Unix epoch
    double pressure;                   ///< Pressure in hPa (mbar)
    double temperature_from_pressure;  ///< Pressure sensor die temperature in °C
    double humidity;                   ///< Relative humidity in %
    double temperature_from_humidity;  ///< Humidity sensor die temperature in °C

    /**
     * @brief Default constructor - zeroes every field
     */
    Sample()
        : captured_at(0.0)
        , pressure(0.0)
        , temperature_from_pressure(0.0)
        , humidity(0.0)
        , temperature_from_humidity(0.0)
    {}

    Sample(double t, double p, double tp, double h, double th)
        : captured_at(t)
        , pressure(p)
        , temperature_from_pressure(tp)
        , humidity(h)
        , temperature_from_humidity(th)
    {}

    /**
     * @brief True when no sensor field carries a NaN or infinite sentinel
     */
    bool all_finite() const {
        return std::isfinite(pressure) && std::isfinite(temperature_from_pressure) &&
               std::isfinite(humidity) && std::isfinite(temperature_from_humidity);
    }

    /**
     * @brief Format sample as human-readable string for diagnostics
     */
    std::string to_string() const {
        char buffer[256];
        std::snprintf(buffer, sizeof(buffer),
            "Sample{t=%.3fs, pressure=%.2fhPa, temp_p=%.2fC, "
            "humidity=%.2f%%, temp_h=%.2fC}",
            captured_at, pressure, temperature_from_pressure,
            humidity, temperature_from_humidity);
        return std::string(buffer);
    }
};

/**
 * @brief Canonical decimal rendering of a double for the record log
 *
 * Produces the shortest digit string that parses back to the same value and
 * lays it out the way a Python float repr does, which is the format the
 * existing log consumers were written against:
 * - fixed notation for decimal exponents in [-4, 16), always with a
 *   fractional part ("45.0", "1700000000.0", "0.0001")
 * - scientific notation otherwise, exponent signed and at least two digits
 *   ("1e+16", "1.5e-05")
 * - "nan", "inf" and "-inf" for non-finite values
 */
inline std::string format_number(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v < 0 ? "-inf" : "inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    bool negative = !sci.empty() && sci[0] == '-';
    std::size_t start = negative ? 1 : 0;
    std::size_t epos = sci.find('e');
    int exponent = std::atoi(sci.c_str() + epos + 1);

    std::string digits;
    for (std::size_t i = start; i < epos; ++i) {
        if (sci[i] != '.') digits += sci[i];
    }

    std::string out = negative ? "-" : "";
    if (exponent >= -4 && exponent < 16) {
        if (exponent < 0) {
            out += "0.";
            out.append(static_cast<std::size_t>(-exponent - 1), '0');
            out += digits;
        } else {
            std::size_t int_len = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= int_len) {
                out += digits;
                out.append(int_len - digits.size(), '0');
                out += ".0";
            } else {
                out += digits.substr(0, int_len);
                out += '.';
                out += digits.substr(int_len);
            }
        }
    } else {
        out += digits[0];
        if (digits.size() > 1) {
            out += '.';
            out += digits.substr(1);
        }
        char exp_buf[8];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d",
                      exponent < 0 ? '-' : '+', std::abs(exponent));
        out += exp_buf;
    }
    return out;
}

/**
 * @brief Serialize a sample into one record line
 *
 * Fields are joined by a single tab in the fixed order captured_at,
 * pressure, temperature_from_pressure, humidity, temperature_from_humidity,
 * and the line ends with a single '\n' regardless of platform.
 */
inline std::string to_record_line(const Sample& s) {
    std::string line;
    line.reserve(96);
    line += format_number(s.captured_at);
    line += '\t';
    line += format_number(s.pressure);
    line += '\t';
    line += format_number(s.temperature_from_pressure);
    line += '\t';
    line += format_number(s.humidity);
    line += '\t';
    line += format_number(s.temperature_from_humidity);
    line += '\n';
    return line;
}
