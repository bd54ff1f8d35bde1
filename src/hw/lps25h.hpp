#pragma once
#include "i2c_device.hpp"
#include <cstdint>
#include <memory>

/**
 * @brief ST LPS25H barometric pressure sensor driver
 *
 * Reports absolute pressure and the die temperature of the pressure sensor.
 * Runs the device in continuous mode at 25 Hz with block data update so the
 * three pressure bytes always come from the same conversion.
 *
 * Conversion (datasheet DocID023722):
 * - pressure    = PRESS_OUT (24-bit two's complement) / 4096  [hPa]
 * - temperature = 42.5 + TEMP_OUT (16-bit two's complement) / 480  [°C]
 */
class LPS25H {
public:
    static constexpr std::uint16_t DEFAULT_ADDRESS = 0x5c;

    static constexpr std::uint8_t REG_WHO_AM_I = 0x0f;
    static constexpr std::uint8_t REG_CTRL_REG1 = 0x20;
    static constexpr std::uint8_t REG_PRESS_OUT_XL = 0x28;
    static constexpr std::uint8_t REG_TEMP_OUT_L = 0x2b;
    static constexpr std::uint8_t AUTO_INCREMENT = 0x80;

    static constexpr std::uint8_t WHO_AM_I_VALUE = 0xbd;
    static constexpr std::uint8_t CTRL_POWER_ON_25HZ_BDU = 0xc4;  ///< PD | ODR=25Hz | BDU

private:
    std::unique_ptr<II2CDevice> dev_;

public:
    explicit LPS25H(std::unique_ptr<II2CDevice> dev) : dev_(std::move(dev)) {}

    /**
     * @brief Take the device out of power-down and start conversions
     */
    void power_on() {
        dev_->write_register(REG_CTRL_REG1, CTRL_POWER_ON_25HZ_BDU);
    }

    void power_off() {
        dev_->write_register(REG_CTRL_REG1, 0x00);
    }

    /**
     * @brief Check the identification register
     * @return true if the device answers as an LPS25H
     */
    bool probe() {
        std::uint8_t id = 0;
        dev_->read_registers(REG_WHO_AM_I, &id, 1);
        return id == WHO_AM_I_VALUE;
    }

    double read_pressure() {
        std::uint8_t raw[3];
        dev_->read_registers(REG_PRESS_OUT_XL | AUTO_INCREMENT, raw, sizeof(raw));
        return pressure_from_raw(raw);
    }

    double read_temperature() {
        std::uint8_t raw[2];
        dev_->read_registers(REG_TEMP_OUT_L | AUTO_INCREMENT, raw, sizeof(raw));
        return temperature_from_raw(raw);
    }

    /**
     * @brief Convert PRESS_OUT_XL/L/H bytes to hPa
     */
    static double pressure_from_raw(const std::uint8_t raw[3]) {
        std::int32_t counts = static_cast<std::int32_t>(raw[2]) << 16 |
                              static_cast<std::int32_t>(raw[1]) << 8 |
                              static_cast<std::int32_t>(raw[0]);
        if (counts & 0x800000) {
            counts -= 0x1000000;  // sign-extend 24-bit value
        }
        return counts / 4096.0;
    }

    /**
     * @brief Convert TEMP_OUT_L/H bytes to °C
     */
    static double temperature_from_raw(const std::uint8_t raw[2]) {
        auto counts = static_cast<std::int16_t>(static_cast<std::uint16_t>(raw[1]) << 8 | raw[0]);
        return 42.5 + counts / 480.0;
    }

    std::string describe() const {
        return dev_->describe();
    }
};
