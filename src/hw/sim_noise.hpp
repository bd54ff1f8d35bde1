#pragma once
#include <cstdint>
#include <random>

/**
 * @brief Noise source for the simulated environmental sensor
 *
 * Gaussian white noise stands in for ADC and thermal noise; summed per
 * channel it also drives the slow random-walk drift of ambient conditions.
 *
 * Seedable so tests and demos can reproduce a sequence.
 */
class NoiseSimulator {
private:
    std::mt19937_64 rng_;                           ///< Random number generator
    std::normal_distribution<double> normal_;       ///< Unit Gaussian

public:
    /**
     * @brief Construct noise simulator with optional seed
     * @param seed Random seed (0 = use random device)
     */
    explicit NoiseSimulator(std::uint64_t seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
        , normal_(0.0, 1.0)
    {}

    /**
     * @brief Generate Gaussian white noise
     * @param mean Mean value
     * @param std_dev Standard deviation
     */
    double gaussian(double mean = 0.0, double std_dev = 1.0) {
        return mean + std_dev * normal_(rng_);
    }
};
