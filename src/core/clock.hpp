#pragma once
#include <chrono>
#include <thread>

/**
 * @brief Wall-clock source used to timestamp samples
 *
 * Injected into the sensor reader so tests can supply fixed timestamps.
 */
struct WallClock {
    virtual ~WallClock() = default;

    /**
     * @brief Current time in seconds since the Unix epoch
     */
    virtual double now_seconds() const = 0;
};

/**
 * @brief WallClock backed by std::chrono::system_clock
 */
struct SystemWallClock : WallClock {
    double now_seconds() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }
};

/**
 * @brief One-shot settling deadline for freshly powered sensors
 *
 * Armed when a device is powered on; wait() blocks with sleep_until so the
 * total delay is measured from power-on and not from the time of the call.
 */
struct SettleTimer {
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds period{0};
    clock::time_point deadline{clock::now()};

    /**
     * @brief Arm the timer to expire after p from now
     * @param p Settling time required by the device
     */
    void arm(std::chrono::nanoseconds p) {
        period = p;
        deadline = clock::now() + p;
    }

    /**
     * @brief Block until the deadline has passed (returns at once if it has)
     */
    void wait() const {
        std::this_thread::sleep_until(deadline);
    }

    /**
     * @brief Get time until the deadline
     * @return Remaining duration, zero once expired
     */
    std::chrono::nanoseconds time_to_ready() const {
        auto now = clock::now();
        if (deadline <= now) {
            return std::chrono::nanoseconds::zero();
        }
        return std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - now);
    }

    bool expired() const {
        return time_to_ready() == std::chrono::nanoseconds::zero();
    }
};
