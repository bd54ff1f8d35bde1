#pragma once
#include <chrono>
#include <string>

/**
 * @brief Abstract environmental sensor capability
 *
 * Hardware abstraction for a pressure + humidity sensor module that also
 * reports the die temperature of each sensor. The sampling pipeline only
 * talks to this interface, so a real board, a simulation or a test fake can
 * be passed in explicitly.
 *
 * Read operations return whatever the device reports, including NaN or
 * infinite sentinels for a faulted sub-sensor. They throw a
 * std::runtime_error (or subclass) when the device cannot be reached at all.
 */
class IEnvSensor {
public:
    /**
     * @brief Sensor error states
     */
    enum class ErrorState {
        OK = 0,                    ///< Normal operation
        NOT_INITIALIZED,           ///< Sensor not powered on / configured
        COMMUNICATION_ERROR,       ///< Bus transfer with the device failed
        WRONG_DEVICE,              ///< Device did not identify as the expected part
        UNKNOWN_ERROR              ///< Unspecified error condition
    };

protected:
    ErrorState last_error_{ErrorState::OK};    ///< Last error encountered
    std::string last_error_message_;            ///< Detail for last_error_
    std::string sensor_id_;                     ///< Unique sensor identifier
    bool initialized_{false};                  ///< Initialization state

public:
    virtual ~IEnvSensor() = default;

    /**
     * @brief Initialize (power on and configure) the sensor hardware
     * @return true if initialization successful
     */
    virtual bool initialize() {
        initialized_ = true;
        last_error_ = ErrorState::OK;
        return true;
    }

    /**
     * @brief Shutdown sensor and release resources
     */
    virtual void shutdown() {
        initialized_ = false;
    }

    /**
     * @brief Block until a freshly initialized device produces valid data
     *
     * Default is a no-op for devices without a settling period.
     */
    virtual void settle() {}

    /**
     * @brief Remaining time settle() would block for; zero when ready
     */
    virtual std::chrono::nanoseconds time_to_ready() const {
        return std::chrono::nanoseconds::zero();
    }

    virtual double read_pressure() = 0;                   ///< hPa
    virtual double read_temperature_from_pressure() = 0;  ///< °C
    virtual double read_humidity() = 0;                   ///< %rH
    virtual double read_temperature_from_humidity() = 0;  ///< °C

    /**
     * @brief Get sensor type name (for logging)
     */
    virtual std::string get_type_name() const = 0;

    virtual bool is_initialized() const {
        return initialized_;
    }

    std::string get_id() const {
        return sensor_id_;
    }

    void set_id(const std::string& id) {
        sensor_id_ = id;
    }

    ErrorState get_last_error() const {
        return last_error_;
    }

    /**
     * @brief Detail of the last failure (e.g. why initialize() returned false)
     */
    const std::string& get_last_error_message() const {
        return last_error_message_;
    }

    /**
     * @brief Convert error state to human-readable string
     */
    static std::string error_to_string(ErrorState error) {
        switch (error) {
            case ErrorState::OK: return "OK";
            case ErrorState::NOT_INITIALIZED: return "NOT_INITIALIZED";
            case ErrorState::COMMUNICATION_ERROR: return "COMMUNICATION_ERROR";
            case ErrorState::WRONG_DEVICE: return "WRONG_DEVICE";
            case ErrorState::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            default: return "INVALID_ERROR_STATE";
        }
    }
};
