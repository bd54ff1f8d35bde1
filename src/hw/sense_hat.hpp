#pragma once
#include "ienv_sensor.hpp"
#include "i2c_device.hpp"
#include "lps25h.hpp"
#include "hts221.hpp"
#include "../core/clock.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Raspberry Pi Sense HAT environmental sensors
 *
 * Combines the LPS25H (pressure) and HTS221 (humidity) that share the HAT's
 * I2C bus into one IEnvSensor. Both devices are powered on by initialize();
 * the first valid conversion is only available after a short settling time,
 * which settle() waits out.
 *
 * Features:
 * - Bus device and both slave addresses configurable
 * - Device opening injectable for register-level testing
 * - Bus failures reported as I2CError and recorded in last error state
 */
class SenseHat : public IEnvSensor {
public:
    /// Opens the device at a 7-bit address on the configured bus
    using DeviceOpener = std::function<std::unique_ptr<II2CDevice>(std::uint16_t address)>;

    static constexpr const char* DEFAULT_BUS = "/dev/i2c-1";

private:
    DeviceOpener opener_;
    std::uint16_t lps25h_address_;
    std::uint16_t hts221_address_;
    std::chrono::milliseconds settle_time_;
    SettleTimer settle_timer_;

    std::unique_ptr<LPS25H> lps25h_;
    std::unique_ptr<HTS221> hts221_;

    void require_initialized(const char* what) const {
        if (!initialized_) {
            throw std::runtime_error(std::string("Sense HAT not initialized (reading ") + what + ")");
        }
    }

    template<class F>
    double guarded_read(const char* what, F&& read) {
        require_initialized(what);
        try {
            double value = read();
            last_error_ = ErrorState::OK;
            return value;
        } catch (const I2CError& e) {
            last_error_ = ErrorState::COMMUNICATION_ERROR;
            last_error_message_ = e.what();
            throw;
        }
    }

public:
    /**
     * @brief Construct for a Linux i2c-dev bus
     * @param bus Bus device node
     * @param lps25h_address LPS25H slave address
     * @param hts221_address HTS221 slave address
     * @param settle_time Delay after power-on before the first read
     */
    SenseHat(const std::string& bus = DEFAULT_BUS,
             std::uint16_t lps25h_address = LPS25H::DEFAULT_ADDRESS,
             std::uint16_t hts221_address = HTS221::DEFAULT_ADDRESS,
             std::chrono::milliseconds settle_time = std::chrono::milliseconds(50))
        : SenseHat([bus](std::uint16_t address) -> std::unique_ptr<II2CDevice> {
                       return std::make_unique<LinuxI2CDevice>(bus, address);
                   },
                   lps25h_address, hts221_address, settle_time)
    {
        set_id(bus);
    }

    /**
     * @brief Construct with a custom device opener
     */
    SenseHat(DeviceOpener opener,
             std::uint16_t lps25h_address,
             std::uint16_t hts221_address,
             std::chrono::milliseconds settle_time)
        : opener_(std::move(opener))
        , lps25h_address_(lps25h_address)
        , hts221_address_(hts221_address)
        , settle_time_(settle_time)
    {
        set_id("sense_hat");
    }

    /**
     * @brief Open and identify both devices, power them on and load HTS221
     *        calibration
     * @return false if either device cannot be reached or identified; the
     *         reason is
     *         available from get_last_error_message()
     */
    bool initialize() override {
        try {
            lps25h_ = std::make_unique<LPS25H>(opener_(lps25h_address_));
            hts221_ = std::make_unique<HTS221>(opener_(hts221_address_));
            if (!lps25h_->probe() || !hts221_->probe()) {
                std::string where = lps25h_->describe() + ", " + hts221_->describe();
                lps25h_.reset();
                hts221_.reset();
                initialized_ = false;
                last_error_ = ErrorState::WRONG_DEVICE;
                last_error_message_ = "WHO_AM_I mismatch on " + where;
                return false;
            }
            lps25h_->power_on();
            hts221_->power_on();
        } catch (const I2CError& e) {
            lps25h_.reset();
            hts221_.reset();
            initialized_ = false;
            last_error_ = ErrorState::COMMUNICATION_ERROR;
            last_error_message_ = e.what();
            return false;
        }
        settle_timer_.arm(settle_time_);
        return IEnvSensor::initialize();
    }

    /**
     * @brief Power both devices down and close the bus handles
     */
    void shutdown() override {
        if (lps25h_ && hts221_) {
            try {
                lps25h_->power_off();
                hts221_->power_off();
            } catch (const I2CError& e) {
                last_error_ = ErrorState::COMMUNICATION_ERROR;
                last_error_message_ = e.what();
            }
        }
        lps25h_.reset();
        hts221_.reset();
        IEnvSensor::shutdown();
    }

    void settle() override {
        settle_timer_.wait();
    }

    std::chrono::nanoseconds time_to_ready() const override {
        return settle_timer_.time_to_ready();
    }

    double read_pressure() override {
        return guarded_read("pressure", [this] { return lps25h_->read_pressure(); });
    }

    double read_temperature_from_pressure() override {
        return guarded_read("temperature_from_pressure", [this] { return lps25h_->read_temperature(); });
    }

    double read_humidity() override {
        return guarded_read("humidity", [this] { return hts221_->read_humidity(); });
    }

    double read_temperature_from_humidity() override {
        return guarded_read("temperature_from_humidity", [this] { return hts221_->read_temperature(); });
    }

    std::string get_type_name() const override { return "SenseHat"; }

    std::chrono::milliseconds get_settle_time() const {
        return settle_time_;
    }
};
