#include "qmi8658.hpp"
#include <iostream>
#include <string>
#include <utility>

static constexpr uint8_t REG_WHO_AM_I = 0x00;

// Control registers
static constexpr uint8_t REG_CTRL1 = 0x02;
static constexpr uint8_t REG_CTRL7 = 0x08;

static constexpr uint8_t REG_STATUSINT = 0x2D;

// Output registers, little-endian: TEMP (2 bytes), then AX..GZ (12 bytes)
static constexpr uint8_t REG_TEMP_L = 0x33;
static constexpr uint8_t REG_AX_L   = 0x35;

static constexpr size_t SAMPLE_BYTES = 12;

static inline int16_t combine(uint8_t lo, uint8_t hi) {
    return (int16_t)((uint16_t)lo | ((uint16_t)hi << 8));
}

ImuSample decodeSample(const uint8_t* buf) {
    ImuSample s;
    s.accelX = combine(buf[0],  buf[1]);
    s.accelY = combine(buf[2],  buf[3]);
    s.accelZ = combine(buf[4],  buf[5]);
    s.gyroX  = combine(buf[6],  buf[7]);
    s.gyroY  = combine(buf[8],  buf[9]);
    s.gyroZ  = combine(buf[10], buf[11]);
    return s;
}

Qmi8658LatchTimeout::Qmi8658LatchTimeout(unsigned polls)
    : std::runtime_error("QMI8658 did not latch a sample after " +
                         std::to_string(polls) + " status polls"),
      attempts(polls) {}

Qmi8658::Qmi8658(std::unique_ptr<I2CBus> bus_, uint8_t addr_)
    : bus(std::move(bus_)), addr(addr_) {
    if (!bus)
        throw std::invalid_argument("Qmi8658 requires a bus");
}

bool Qmi8658::begin(const Qmi8658Config& config) {
    uint8_t who = readChipId();
    if (who != CHIP_ID) {
        std::cerr << "QMI8658 WHO_AM_I unexpected: 0x"
                  << std::hex << (int)who << std::dec << std::endl;
        return false;
    }

    initialize(config);
    return true;
}

uint8_t Qmi8658::readChipId() {
    return readReg(REG_WHO_AM_I);
}

// Two independent writes; a failure on CTRL7 leaves CTRL1 applied.
void Qmi8658::initialize(const Qmi8658Config& config) {
    try {
        writeReg(REG_CTRL1, config.ctrl1());
    } catch (const I2CError& e) {
        throw Qmi8658InitError(e, REG_CTRL1, false);
    }

    try {
        writeReg(REG_CTRL7, config.ctrl7());
    } catch (const I2CError& e) {
        throw Qmi8658InitError(e, REG_CTRL7, true);
    }
}

int16_t Qmi8658::readTemperature() {
    uint8_t buf[2];
    readBytes(REG_TEMP_L, buf, 2);
    return combine(buf[0], buf[1]);
}

StatusFlags Qmi8658::readStatus() {
    return StatusFlags(readReg(REG_STATUSINT));
}

bool Qmi8658::readSample(ImuSample& sample) {
    if (!readStatus().available())
        return false;

    // The sensor latches the output block once LOCKED is set.
    unsigned polls = 0;
    while (true) {
        if (polls == pollLimit)
            throw Qmi8658LatchTimeout(polls);
        ++polls;
        if (readStatus().locked())
            break;
    }

    sample = readSampleImmediate();
    return true;
}

ImuSample Qmi8658::readSampleImmediate() {
    uint8_t buf[SAMPLE_BYTES];
    readBytes(REG_AX_L, buf, SAMPLE_BYTES);
    return decodeSample(buf);
}

void Qmi8658::setLatchPollLimit(unsigned limit) {
    if (limit == 0)
        throw std::invalid_argument("latch poll limit must be at least 1");
    pollLimit = limit;
}

uint8_t Qmi8658::readReg(uint8_t reg) {
    uint8_t value{};
    bus->writeRead(addr, &reg, 1, &value, 1);
    return value;
}

void Qmi8658::writeReg(uint8_t reg, uint8_t value) {
    uint8_t buf[2] = {reg, value};
    bus->write(addr, buf, 2);
}

void Qmi8658::readBytes(uint8_t reg, uint8_t* buffer, size_t length) {
    bus->writeRead(addr, &reg, 1, buffer, length);
}
