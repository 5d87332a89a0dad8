#pragma once
#include "i2c_bus.hpp"
#include <cstdint>
#include <string>

struct i2c_msg;

// Linux i2c-dev adapter. The target address is given per transfer.
class I2CDevice : public I2CBus {
public:
    explicit I2CDevice(const std::string& device = "/dev/i2c-1");
    ~I2CDevice() override;

    I2CDevice(const I2CDevice&) = delete;
    I2CDevice& operator=(const I2CDevice&) = delete;

    void write(uint8_t address, const uint8_t* data, size_t length) override;
    void writeRead(uint8_t address,
                   const uint8_t* tx, size_t txLength,
                   uint8_t* rx, size_t rxLength) override;

private:
    void transfer(uint8_t address, i2c_msg* msgs, unsigned count);

    std::string path;
    int fd;
};
