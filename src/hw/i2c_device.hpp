#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

/**
 * @brief Bus-level failure talking to an I2C device
 */
struct I2CError : std::runtime_error {
    explicit I2CError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Register-level access to one I2C slave device
 *
 * Drivers are written against this interface so the register protocol can be
 * exercised without a physical bus.
 */
struct II2CDevice {
    virtual ~II2CDevice() = default;

    /**
     * @brief Write one byte to a device register
     * @throws I2CError on bus failure
     */
    virtual void write_register(std::uint8_t reg, std::uint8_t value) = 0;

    /**
     * @brief Read consecutive bytes starting at a register sub-address
     * @param reg Sub-address as sent on the wire (callers add any
     *            auto-increment flag their device needs)
     * @param out Destination buffer
     * @param len Number of bytes to read
     * @throws I2CError on bus failure
     */
    virtual void read_registers(std::uint8_t reg, std::uint8_t* out, std::size_t len) = 0;

    /**
     * @brief Human-readable location, e.g. "/dev/i2c-1@0x5c"
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief II2CDevice backed by the Linux i2c-dev character device
 *
 * Opens the bus node and binds it to one slave address with I2C_SLAVE.
 * The descriptor is owned and closed on destruction.
 */
class LinuxI2CDevice : public II2CDevice {
private:
    int fd_{-1};
    std::string bus_;
    std::uint16_t address_{0};

    static std::string errno_text() {
        return std::strerror(errno);
    }

    void write_all(const std::uint8_t* data, std::size_t len) {
        ssize_t n = ::write(fd_, data, len);
        if (n < 0) {
            throw I2CError("write to " + describe() + " failed: " + errno_text());
        }
        if (static_cast<std::size_t>(n) != len) {
            throw I2CError("short write to " + describe());
        }
    }

public:
    /**
     * @brief Open the bus device and select the slave address
     * @param bus Bus device node (e.g. "/dev/i2c-1")
     * @param address 7-bit slave address
     * @throws I2CError if the node cannot be opened or the address selected
     */
    LinuxI2CDevice(const std::string& bus, std::uint16_t address)
        : bus_(bus), address_(address)
    {
        fd_ = ::open(bus_.c_str(), O_RDWR | O_CLOEXEC);
        if (fd_ < 0) {
            throw I2CError("cannot open " + bus_ + ": " + errno_text());
        }
        if (::ioctl(fd_, I2C_SLAVE, static_cast<unsigned long>(address_)) < 0) {
            std::string reason = errno_text();
            ::close(fd_);
            fd_ = -1;
            throw I2CError("cannot select " + describe() + ": " + reason);
        }
    }

    ~LinuxI2CDevice() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    LinuxI2CDevice(const LinuxI2CDevice&) = delete;
    LinuxI2CDevice& operator=(const LinuxI2CDevice&) = delete;

    void write_register(std::uint8_t reg, std::uint8_t value) override {
        std::uint8_t buf[2] = {reg, value};
        write_all(buf, sizeof(buf));
    }

    void read_registers(std::uint8_t reg, std::uint8_t* out, std::size_t len) override {
        write_all(&reg, 1);
        ssize_t n = ::read(fd_, out, len);
        if (n < 0) {
            throw I2CError("read from " + describe() + " failed: " + errno_text());
        }
        if (static_cast<std::size_t>(n) != len) {
            throw I2CError("short read from " + describe());
        }
    }

    std::string describe() const override {
        char addr[8];
        std::snprintf(addr, sizeof(addr), "0x%02x", static_cast<unsigned>(address_));
        return bus_ + "@" + addr;
    }
};
