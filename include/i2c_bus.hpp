#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Failure reported by the bus (NACK, timeout, arbitration loss, short transfer).
class I2CError : public std::runtime_error {
public:
    I2CError(const std::string& what, uint8_t address, int err = 0)
        : std::runtime_error(what), addr(address), errnum(err) {}

    uint8_t address() const { return addr; }
    int error() const { return errnum; }

private:
    uint8_t addr;
    int errnum;
};

// Byte-oriented two-wire bus. Implementations throw I2CError on failure.
class I2CBus {
public:
    virtual ~I2CBus() = default;

    virtual void write(uint8_t address, const uint8_t* data, size_t length) = 0;

    // Single transaction: write tx, repeated start, read rxLength bytes into rx.
    virtual void writeRead(uint8_t address,
                           const uint8_t* tx, size_t txLength,
                           uint8_t* rx, size_t rxLength) = 0;
};
