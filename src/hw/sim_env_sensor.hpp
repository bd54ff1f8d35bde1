#pragma once
#include "ienv_sensor.hpp"
#include "sim_noise.hpp"
#include <limits>
#include <stdexcept>

/**
 * @brief Simulated Sense HAT for hosts without the hardware
 *
 * Each quantity is a configurable mean plus slow drift plus white noise.
 * Individual sub-sensors can be faulted to return NaN, which is how a real
 * driver reports a dead channel.
 */
class SimulatedEnvSensor : public IEnvSensor {
public:
    /**
     * @brief Simulated quantities
     */
    enum class Channel { PRESSURE, TEMPERATURE_FROM_PRESSURE, HUMIDITY, TEMPERATURE_FROM_HUMIDITY };

    /**
     * @brief Per-channel simulation parameters
     */
    struct ChannelModel {
        double mean{0.0};        ///< Nominal value
        double noise{0.0};       ///< White noise standard deviation
        double drift_step{0.0};  ///< Random-walk step standard deviation
        bool faulted{false};     ///< Report NaN instead of a value
        double drift_state{0.0}; ///< Accumulated random walk
    };

private:
    NoiseSimulator noise_;
    ChannelModel pressure_{1013.25, 0.05, 0.01};
    ChannelModel temp_p_{21.4, 0.02, 0.005};
    ChannelModel humidity_{45.0, 0.3, 0.05};
    ChannelModel temp_h_{21.6, 0.02, 0.005};
    bool enable_noise_{true};

    ChannelModel& model(Channel c) {
        switch (c) {
            case Channel::PRESSURE: return pressure_;
            case Channel::TEMPERATURE_FROM_PRESSURE: return temp_p_;
            case Channel::HUMIDITY: return humidity_;
            case Channel::TEMPERATURE_FROM_HUMIDITY: return temp_h_;
        }
        return pressure_;
    }

    double sample(ChannelModel& m) {
        if (!initialized_) {
            throw std::runtime_error("simulated sensor not initialized");
        }
        if (m.faulted) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (!enable_noise_) {
            return m.mean;
        }
        m.drift_state += noise_.gaussian(0.0, m.drift_step);
        return m.mean + m.drift_state + noise_.gaussian(0.0, m.noise);
    }

public:
    /**
     * @brief Construct simulator
     * @param noise_seed Random seed for noise generation (0 = random)
     */
    explicit SimulatedEnvSensor(std::uint64_t noise_seed = 0)
        : noise_(noise_seed)
    {
        set_id("simulated");
    }

    double read_pressure() override { return sample(pressure_); }
    double read_temperature_from_pressure() override { return sample(temp_p_); }
    double read_humidity() override {
        double h = sample(humidity_);
        if (h < 0.0) return 0.0;
        if (h > 100.0) return 100.0;
        return h;  // NaN falls through both comparisons
    }
    double read_temperature_from_humidity() override { return sample(temp_h_); }

    void set_channel(Channel c, const ChannelModel& m) { model(c) = m; }
    void set_fault(Channel c, bool faulted) { model(c).faulted = faulted; }
    void enable_noise(bool enable) { enable_noise_ = enable; }

    std::string get_type_name() const override { return "SimulatedEnvSensor"; }
};
