#include "../src/hw/sense_hat.hpp"
#include "../src/hw/sim_env_sensor.hpp"
#include "../src/core/clock.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <vector>

/**
 * @brief Register-level fake of one I2C slave
 *
 * Register contents live in a shared map so a test can inspect and modify
 * them after the driver has taken ownership of the device.
 */
struct FakeRegisters {
    std::map<std::uint8_t, std::uint8_t> regs;
    std::vector<std::pair<std::uint8_t, std::uint8_t>> writes;
    bool fail{false};
};

class FakeI2CDevice : public II2CDevice {
private:
    std::shared_ptr<FakeRegisters> state_;
    std::uint16_t address_;

public:
    FakeI2CDevice(std::shared_ptr<FakeRegisters> state, std::uint16_t address)
        : state_(std::move(state)), address_(address) {}

    void write_register(std::uint8_t reg, std::uint8_t value) override {
        if (state_->fail) throw I2CError("fake write failure");
        state_->writes.push_back({reg, value});
        state_->regs[reg] = value;
    }

    void read_registers(std::uint8_t reg, std::uint8_t* out, std::size_t len) override {
        if (state_->fail) throw I2CError("fake read failure");
        std::uint8_t base = reg & 0x7f;  // strip auto-increment flag
        for (std::size_t i = 0; i < len; i++) {
            out[i] = state_->regs[static_cast<std::uint8_t>(base + i)];
        }
    }

    std::string describe() const override {
        return "fake@" + std::to_string(address_);
    }
};

/// LPS25H at 1013.25 hPa / 21.4 °C
std::shared_ptr<FakeRegisters> make_lps25h() {
    auto r = std::make_shared<FakeRegisters>();
    r->regs[LPS25H::REG_WHO_AM_I] = LPS25H::WHO_AM_I_VALUE;
    r->regs[0x28] = 0x00;  // 0x3f5400 = 4150272 = 1013.25 * 4096
    r->regs[0x29] = 0x54;
    r->regs[0x2a] = 0x3f;
    r->regs[0x2b] = 0x70;  // 0xd870 = -10128 -> 42.5 - 21.1
    r->regs[0x2c] = 0xd8;
    return r;
}

/// HTS221 calibrated 20..70 %rH over 1000..6000 and 20..35 °C over 0..1500,
/// currently reading 45 %rH / 21.6 °C
std::shared_ptr<FakeRegisters> make_hts221() {
    auto r = std::make_shared<FakeRegisters>();
    r->regs[HTS221::REG_WHO_AM_I] = HTS221::WHO_AM_I_VALUE;
    const std::uint8_t calib[16] = {
        40, 140,          // H0_rH_x2, H1_rH_x2
        0xa0, 0x18,       // T0_degC_x8 = 160, T1_degC_x8 low byte
        0x00, 0x04,       // reserved, T1 msb = 1 -> 0x118 = 280
        0xe8, 0x03,       // H0_T0_OUT = 1000
        0x00, 0x00,       // reserved
        0x70, 0x17,       // H1_T0_OUT = 6000
        0x00, 0x00,       // T0_OUT = 0
        0xdc, 0x05        // T1_OUT = 1500
    };
    for (int i = 0; i < 16; i++) {
        r->regs[static_cast<std::uint8_t>(0x30 + i)] = calib[i];
    }
    r->regs[0x28] = 0xac;  // H_OUT = 3500
    r->regs[0x29] = 0x0d;
    r->regs[0x2a] = 0xa0;  // T_OUT = 160
    r->regs[0x2b] = 0x00;
    return r;
}

/**
 * @brief Test sensor drivers and capability implementations
 *
 * This test suite verifies:
 * 1. LPS25H raw conversion including sign extension
 * 2. HTS221 calibration decoding and interpolation
 * 3. SenseHat initialization, reads and error reporting over fake devices
 * 4. Settling delay after power-on
 * 5. SimulatedEnvSensor behaviour
 */
int main() {
    std::cout << "Testing environmental sensor drivers..." << std::endl;

    // Test 1: LPS25H conversions
    {
        std::cout << "Test 1: LPS25H conversion" << std::endl;

        const std::uint8_t p[3] = {0x00, 0x54, 0x3f};
        assert(LPS25H::pressure_from_raw(p) == 1013.25);

        const std::uint8_t p_neg[3] = {0x00, 0xf0, 0xff};  // -4096 counts
        assert(LPS25H::pressure_from_raw(p_neg) == -1.0);

        const std::uint8_t t[2] = {0x70, 0xd8};
        assert(std::abs(LPS25H::temperature_from_raw(t) - 21.4) < 1e-9);

        const std::uint8_t t_zero[2] = {0x00, 0x00};
        assert(LPS25H::temperature_from_raw(t_zero) == 42.5);

        std::cout << "  LPS25H conversion test passed" << std::endl;
    }

    // Test 2: HTS221 calibration
    {
        std::cout << "Test 2: HTS221 calibration" << std::endl;

        auto regs = make_hts221();
        std::uint8_t block[16];
        for (int i = 0; i < 16; i++) block[i] = regs->regs[static_cast<std::uint8_t>(0x30 + i)];

        auto c = HTS221::Calibration::from_registers(block);
        assert(c.h0_rh == 20.0);
        assert(c.h1_rh == 70.0);
        assert(c.t0_degc == 20.0);
        assert(c.t1_degc == 35.0);
        assert(c.h0_t0_out == 1000);
        assert(c.h1_t0_out == 6000);
        assert(c.t0_out == 0);
        assert(c.t1_out == 1500);

        assert(c.humidity(3500) == 45.0);
        assert(c.humidity(1000) == 20.0);
        assert(c.humidity(-30000) == 0.0);    // clamped low
        assert(c.humidity(30000) == 100.0);   // clamped high
        assert(std::abs(c.temperature(160) - 21.6) < 1e-9);
        assert(c.temperature(-1500) == 5.0);  // extrapolates below T0

        HTS221::Calibration degenerate = c;
        degenerate.h1_t0_out = degenerate.h0_t0_out;
        degenerate.t1_out = degenerate.t0_out;
        assert(degenerate.humidity(4242) == 20.0);
        assert(degenerate.temperature(4242) == 20.0);

        std::cout << "  HTS221 calibration test passed" << std::endl;
    }

    // Test 3: SenseHat over fake devices
    {
        std::cout << "Test 3: SenseHat reads" << std::endl;

        auto lps = make_lps25h();
        auto hts = make_hts221();
        SenseHat hat([&](std::uint16_t addr) -> std::unique_ptr<II2CDevice> {
                         if (addr == 0x5c) return std::make_unique<FakeI2CDevice>(lps, addr);
                         if (addr == 0x5f) return std::make_unique<FakeI2CDevice>(hts, addr);
                         throw I2CError("no device at " + std::to_string(addr));
                     },
                     0x5c, 0x5f, std::chrono::milliseconds(0));

        assert(!hat.is_initialized());
        assert(hat.initialize());
        assert(hat.is_initialized());
        assert(hat.get_type_name() == "SenseHat");

        // Both devices powered on in continuous mode
        assert(lps->regs[LPS25H::REG_CTRL_REG1] == LPS25H::CTRL_POWER_ON_25HZ_BDU);
        assert(hts->regs[HTS221::REG_CTRL_REG1] == HTS221::CTRL_POWER_ON_12HZ_BDU);

        hat.settle();
        assert(hat.read_pressure() == 1013.25);
        assert(std::abs(hat.read_temperature_from_pressure() - 21.4) < 1e-9);
        assert(hat.read_humidity() == 45.0);
        assert(std::abs(hat.read_temperature_from_humidity() - 21.6) < 1e-9);
        assert(hat.get_last_error() == IEnvSensor::ErrorState::OK);

        // Bus failure mid-run surfaces as I2CError and is recorded
        hts->fail = true;
        bool threw = false;
        try {
            hat.read_humidity();
        } catch (const I2CError&) {
            threw = true;
        }
        assert(threw);
        assert(hat.get_last_error() == IEnvSensor::ErrorState::COMMUNICATION_ERROR);
        assert(hat.get_last_error_message().find("fake read failure") != std::string::npos);
        hts->fail = false;

        hat.shutdown();
        assert(!hat.is_initialized());
        assert(lps->regs[LPS25H::REG_CTRL_REG1] == 0x00);
        assert(hts->regs[HTS221::REG_CTRL_REG1] == 0x00);

        threw = false;
        try {
            hat.read_pressure();
        } catch (const std::runtime_error& e) {
            threw = true;
            assert(std::string(e.what()).find("not initialized") != std::string::npos);
        }
        assert(threw);

        std::cout << "  SenseHat reads test passed" << std::endl;
    }

    // Test 4: SenseHat initialization failures
    {
        std::cout << "Test 4: SenseHat initialization failures" << std::endl;

        auto lps = make_lps25h();
        auto hts = make_hts221();

        // Missing device on the bus
        SenseHat missing([&](std::uint16_t addr) -> std::unique_ptr<II2CDevice> {
                             if (addr == 0x5c) return std::make_unique<FakeI2CDevice>(lps, addr);
                             throw I2CError("no device at " + std::to_string(addr));
                         },
                         0x5c, 0x5f, std::chrono::milliseconds(0));
        assert(!missing.initialize());
        assert(!missing.is_initialized());
        assert(missing.get_last_error() == IEnvSensor::ErrorState::COMMUNICATION_ERROR);
        assert(missing.get_last_error_message().find("no device at 95") != std::string::npos);

        // Wrong part answering at the address
        hts->regs[HTS221::REG_WHO_AM_I] = 0x00;
        SenseHat wrong([&](std::uint16_t addr) -> std::unique_ptr<II2CDevice> {
                           return std::make_unique<FakeI2CDevice>(addr == 0x5c ? lps : hts, addr);
                       },
                       0x5c, 0x5f, std::chrono::milliseconds(0));
        assert(!wrong.initialize());
        assert(wrong.get_last_error() == IEnvSensor::ErrorState::WRONG_DEVICE);
        assert(IEnvSensor::error_to_string(wrong.get_last_error()) == "WRONG_DEVICE");
        assert(hts->writes.empty());  // never powered on

        // Real bus node that does not exist
        SenseHat absent("/dev/senselog-no-such-bus", 0x5c, 0x5f, std::chrono::milliseconds(0));
        assert(!absent.initialize());
        assert(absent.get_last_error_message().find("/dev/senselog-no-such-bus") != std::string::npos);

        std::cout << "  Initialization failures test passed" << std::endl;
    }

    // Test 5: Settling delay measured from power-on
    {
        std::cout << "Test 5: Settling delay" << std::endl;

        SettleTimer timer;
        assert(timer.expired());

        timer.arm(std::chrono::milliseconds(40));
        assert(!timer.expired());
        std::this_thread::sleep_for(std::chrono::milliseconds(15));

        auto start = std::chrono::steady_clock::now();
        timer.wait();
        auto waited = std::chrono::steady_clock::now() - start;
        double waited_ms = std::chrono::duration<double, std::milli>(waited).count();

        std::cout << "  Waited " << waited_ms << " ms of 40 ms (15 ms already elapsed)" << std::endl;
        assert(waited_ms >= 15.0);
        assert(waited_ms < 40.0 + 50.0);  // generous for loaded machines
        assert(timer.expired());

        auto lps = make_lps25h();
        auto hts = make_hts221();
        SenseHat hat([&](std::uint16_t addr) -> std::unique_ptr<II2CDevice> {
                         return std::make_unique<FakeI2CDevice>(addr == 0x5c ? lps : hts, addr);
                     },
                     0x5c, 0x5f, std::chrono::milliseconds(30));
        assert(hat.get_settle_time() == std::chrono::milliseconds(30));
        auto t0 = std::chrono::steady_clock::now();
        assert(hat.initialize());
        assert(hat.time_to_ready() > std::chrono::nanoseconds::zero());
        assert(hat.time_to_ready() <= std::chrono::milliseconds(30));
        hat.settle();
        assert(hat.time_to_ready() == std::chrono::nanoseconds::zero());
        double settle_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        assert(settle_ms >= 29.0);

        std::cout << "  Settling delay test passed" << std::endl;
    }

    // Test 6: Simulated sensor
    {
        std::cout << "Test 6: SimulatedEnvSensor" << std::endl;

        SimulatedEnvSensor sim(42);
        bool threw = false;
        try {
            sim.read_pressure();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        assert(sim.initialize());
        sim.enable_noise(false);
        assert(sim.read_pressure() == 1013.25);
        assert(sim.read_temperature_from_pressure() == 21.4);
        assert(sim.read_humidity() == 45.0);
        assert(sim.read_temperature_from_humidity() == 21.6);

        sim.set_fault(SimulatedEnvSensor::Channel::PRESSURE, true);
        assert(std::isnan(sim.read_pressure()));
        sim.set_fault(SimulatedEnvSensor::Channel::PRESSURE, false);

        sim.set_channel(SimulatedEnvSensor::Channel::HUMIDITY, {99.9, 5.0, 1.0, false});
        sim.enable_noise(true);
        for (int i = 0; i < 1000; i++) {
            double p = sim.read_pressure();
            double h = sim.read_humidity();
            assert(std::abs(p - 1013.25) < 10.0);
            assert(h >= 0.0 && h <= 100.0);
        }

        // Same seed, same sequence
        SimulatedEnvSensor a(7), b(7);
        a.initialize();
        b.initialize();
        for (int i = 0; i < 10; i++) {
            assert(a.read_pressure() == b.read_pressure());
        }

        std::cout << "  SimulatedEnvSensor test passed" << std::endl;
    }

    std::cout << "✅ All environmental sensor tests passed!" << std::endl;
    return 0;
}
