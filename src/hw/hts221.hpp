#pragma once
#include "i2c_device.hpp"
#include <algorithm>
#include <cstdint>
#include <memory>

/**
 * @brief ST HTS221 relative humidity sensor driver
 *
 * Humidity and temperature are not reported in physical units; each device
 * carries two factory calibration points per quantity in registers
 * 0x30..0x3F and the raw output is linearly interpolated between them.
 */
class HTS221 {
public:
    static constexpr std::uint16_t DEFAULT_ADDRESS = 0x5f;

    static constexpr std::uint8_t REG_WHO_AM_I = 0x0f;
    static constexpr std::uint8_t REG_CTRL_REG1 = 0x20;
    static constexpr std::uint8_t REG_HUMIDITY_OUT_L = 0x28;
    static constexpr std::uint8_t REG_TEMP_OUT_L = 0x2a;
    static constexpr std::uint8_t REG_CALIB_START = 0x30;
    static constexpr std::uint8_t AUTO_INCREMENT = 0x80;

    static constexpr std::uint8_t WHO_AM_I_VALUE = 0xbc;
    static constexpr std::uint8_t CTRL_POWER_ON_12HZ_BDU = 0x87;  ///< PD | BDU | ODR=12.5Hz

    /**
     * @brief Factory calibration points decoded from registers 0x30..0x3F
     */
    struct Calibration {
        double h0_rh{0.0};          ///< Humidity at first point (%rH)
        double h1_rh{0.0};          ///< Humidity at second point (%rH)
        std::int16_t h0_t0_out{0};  ///< Raw humidity output at h0_rh
        std::int16_t h1_t0_out{0};  ///< Raw humidity output at h1_rh
        double t0_degc{0.0};        ///< Temperature at first point (°C)
        double t1_degc{0.0};        ///< Temperature at second point (°C)
        std::int16_t t0_out{0};     ///< Raw temperature output at t0_degc
        std::int16_t t1_out{0};     ///< Raw temperature output at t1_degc

        /**
         * @brief Decode the 16-byte calibration block
         * @param b Bytes read from 0x30 onwards
         */
        static Calibration from_registers(const std::uint8_t b[16]) {
            auto s16 = [](std::uint8_t lo, std::uint8_t hi) {
                return static_cast<std::int16_t>(static_cast<std::uint16_t>(hi) << 8 | lo);
            };
            Calibration c;
            c.h0_rh = b[0] / 2.0;
            c.h1_rh = b[1] / 2.0;
            // T0/T1 are 10-bit values, upper two bits of each packed in 0x35
            unsigned t0_x8 = static_cast<unsigned>(b[5] & 0x03) << 8 | b[2];
            unsigned t1_x8 = static_cast<unsigned>(b[5] & 0x0c) << 6 | b[3];
            c.t0_degc = t0_x8 / 8.0;
            c.t1_degc = t1_x8 / 8.0;
            c.h0_t0_out = s16(b[6], b[7]);
            c.h1_t0_out = s16(b[10], b[11]);
            c.t0_out = s16(b[12], b[13]);
            c.t1_out = s16(b[14], b[15]);
            return c;
        }

        /**
         * @brief Interpolate raw humidity output to %rH, clamped to [0, 100]
         */
        double humidity(std::int16_t h_out) const {
            if (h1_t0_out == h0_t0_out) {
                return h0_rh;
            }
            double rh = h0_rh + (static_cast<double>(h_out) - h0_t0_out) * (h1_rh - h0_rh) /
                                (static_cast<double>(h1_t0_out) - h0_t0_out);
            return std::max(0.0, std::min(100.0, rh));
        }

        /**
         * @brief Interpolate raw temperature output to °C
         */
        double temperature(std::int16_t t_out) const {
            if (t1_out == t0_out) {
                return t0_degc;
            }
            return t0_degc + (static_cast<double>(t_out) - t0_out) * (t1_degc - t0_degc) /
                             (static_cast<double>(t1_out) - t0_out);
        }
    };

private:
    std::unique_ptr<II2CDevice> dev_;
    Calibration calib_;
    bool calibrated_{false};

    std::int16_t read_s16(std::uint8_t reg) {
        std::uint8_t raw[2];
        dev_->read_registers(reg | AUTO_INCREMENT, raw, sizeof(raw));
        return static_cast<std::int16_t>(static_cast<std::uint16_t>(raw[1]) << 8 | raw[0]);
    }

public:
    explicit HTS221(std::unique_ptr<II2CDevice> dev) : dev_(std::move(dev)) {}

    /**
     * @brief Power on, start continuous conversion and load calibration
     */
    void power_on() {
        dev_->write_register(REG_CTRL_REG1, CTRL_POWER_ON_12HZ_BDU);
        load_calibration();
    }

    void power_off() {
        dev_->write_register(REG_CTRL_REG1, 0x00);
    }

    bool probe() {
        std::uint8_t id = 0;
        dev_->read_registers(REG_WHO_AM_I, &id, 1);
        return id == WHO_AM_I_VALUE;
    }

    void load_calibration() {
        std::uint8_t block[16];
        dev_->read_registers(REG_CALIB_START | AUTO_INCREMENT, block, sizeof(block));
        calib_ = Calibration::from_registers(block);
        calibrated_ = true;
    }

    double read_humidity() {
        if (!calibrated_) load_calibration();
        return calib_.humidity(read_s16(REG_HUMIDITY_OUT_L));
    }

    double read_temperature() {
        if (!calibrated_) load_calibration();
        return calib_.temperature(read_s16(REG_TEMP_OUT_L));
    }

    std::string describe() const {
        return dev_->describe();
    }
};
