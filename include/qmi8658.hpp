#pragma once
#include "i2c_bus.hpp"
#include "qmi8658_config.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>

// Raw counts, no unit scaling.
struct ImuSample {
    int16_t accelX, accelY, accelZ;
    int16_t gyroX, gyroY, gyroZ; // pitch, roll, yaw rate
};

// Decodes the 12-byte AX_L burst block (little-endian pairs).
ImuSample decodeSample(const uint8_t* bytes);

// STATUSINT snapshot.
class StatusFlags {
public:
    explicit StatusFlags(uint8_t raw) : bits(raw) {}

    bool available() const { return bits & 0x01; }
    bool locked() const { return bits & 0x02; }
    uint8_t raw() const { return bits; }

private:
    uint8_t bits;
};

// A CTRL1 or CTRL7 write failed. ctrl1Written() tells whether the sensor
// is left with CTRL1 applied and CTRL7 unchanged.
class Qmi8658InitError : public I2CError {
public:
    Qmi8658InitError(const I2CError& cause, uint8_t failedReg, bool wroteCtrl1)
        : I2CError(cause), reg(failedReg), ctrl1Done(wroteCtrl1) {}

    uint8_t failedRegister() const { return reg; }
    bool ctrl1Written() const { return ctrl1Done; }

private:
    uint8_t reg;
    bool ctrl1Done;
};

// AVAILABLE was seen but LOCKED never was within the poll limit.
class Qmi8658LatchTimeout : public std::runtime_error {
public:
    explicit Qmi8658LatchTimeout(unsigned polls);

    unsigned polls() const { return attempts; }

private:
    unsigned attempts;
};

class Qmi8658 {
public:
    static constexpr uint8_t DEFAULT_ADDRESS = 0x6b;
    static constexpr uint8_t CHIP_ID = 0x05;
    static constexpr unsigned DEFAULT_LATCH_POLL_LIMIT = 1000;

    explicit Qmi8658(std::unique_ptr<I2CBus> bus, uint8_t addr = DEFAULT_ADDRESS);

    bool begin(const Qmi8658Config& config); // WHO_AM_I check + initialize

    uint8_t readChipId();
    void initialize(const Qmi8658Config& config);
    int16_t readTemperature();
    StatusFlags readStatus();

    // false when no new sample is available; sample is left untouched.
    bool readSample(ImuSample& sample);

    // Burst read without the AVAILABLE/LOCKED handshake; may be torn.
    ImuSample readSampleImmediate();

    void setLatchPollLimit(unsigned limit);
    unsigned latchPollLimit() const { return pollLimit; }

    uint8_t address() const { return addr; }

private:
    uint8_t readReg(uint8_t reg);
    void writeReg(uint8_t reg, uint8_t value);
    void readBytes(uint8_t reg, uint8_t* buffer, size_t length);

    std::unique_ptr<I2CBus> bus;
    uint8_t addr;
    unsigned pollLimit = DEFAULT_LATCH_POLL_LIMIT;
};
