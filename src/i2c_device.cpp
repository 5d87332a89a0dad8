#include "i2c_device.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <cerrno>
#include <cstring>

I2CDevice::I2CDevice(const std::string& device) : path(device) {
    fd = open(device.c_str(), O_RDWR);
    if (fd < 0) {
        int err = errno;
        throw I2CError("Failed to open I2C adapter " + device + ": " + std::strerror(err), 0, err);
    }
}

I2CDevice::~I2CDevice() {
    if (fd >= 0) close(fd);
}

void I2CDevice::write(uint8_t address, const uint8_t* data, size_t length) {
    i2c_msg msg{};
    msg.addr = address;
    msg.flags = 0;
    msg.len = static_cast<__u16>(length);
    msg.buf = const_cast<uint8_t*>(data);

    transfer(address, &msg, 1);
}

void I2CDevice::writeRead(uint8_t address,
                          const uint8_t* tx, size_t txLength,
                          uint8_t* rx, size_t rxLength) {
    i2c_msg msgs[2]{};
    msgs[0].addr = address;
    msgs[0].flags = 0;
    msgs[0].len = static_cast<__u16>(txLength);
    msgs[0].buf = const_cast<uint8_t*>(tx);

    msgs[1].addr = address;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len = static_cast<__u16>(rxLength);
    msgs[1].buf = rx;

    transfer(address, msgs, 2);
}

void I2CDevice::transfer(uint8_t address, i2c_msg* msgs, unsigned count) {
    i2c_rdwr_ioctl_data data{};
    data.msgs = msgs;
    data.nmsgs = count;

    int done = ioctl(fd, I2C_RDWR, &data);
    if (done < 0) {
        int err = errno;
        throw I2CError("I2C transfer to " + path + " failed: " + std::strerror(err), address, err);
    }
    if (static_cast<unsigned>(done) != count)
        throw I2CError("I2C transfer to " + path + " incomplete", address);
}
