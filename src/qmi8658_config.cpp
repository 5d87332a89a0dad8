#include "qmi8658_config.hpp"

// CTRL1 bits
static constexpr uint8_t CTRL1_SENSOR_DISABLE = 1 << 0;
static constexpr uint8_t CTRL1_FIFO_INT_SEL   = 1 << 2;
static constexpr uint8_t CTRL1_INT1_EN        = 1 << 3;
static constexpr uint8_t CTRL1_INT2_EN        = 1 << 4;
static constexpr uint8_t CTRL1_BE             = 1 << 5; // set on reset
static constexpr uint8_t CTRL1_ADDR_AI        = 1 << 6;
static constexpr uint8_t CTRL1_SIM            = 1 << 7;

// CTRL7 bits
static constexpr uint8_t CTRL7_AEN      = 1 << 0;
static constexpr uint8_t CTRL7_GEN      = 1 << 1;
static constexpr uint8_t CTRL7_GSN      = 1 << 4;
static constexpr uint8_t CTRL7_DRDY_DIS = 1 << 5;
static constexpr uint8_t CTRL7_SYNC     = 1 << 7;

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::standard() {
    return Qmi8658ConfigBuilder()
        .addressAutoIncrement()
        .enableAccelerometer()
        .enableGyroscope();
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::disableInternalOscillator() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.oscillatorOff = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::fifoInterruptOnInt1() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.fifoIntOnInt1 = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::enableInt1() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.int1 = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::enableInt2() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.int2 = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::littleEndian() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.littleEndian = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::addressAutoIncrement() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.autoIncrement = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::threeWireBus() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.threeWire = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::enableAccelerometer() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.accel = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::enableGyroscope() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.gyro = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::gyroscopeSnooze() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.gyroSnooze = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::disableDataReady() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.dataReadyOff = true;
    return b;
}

Qmi8658ConfigBuilder Qmi8658ConfigBuilder::syncSample() const {
    Qmi8658ConfigBuilder b(*this);
    b.opts.syncSample = true;
    return b;
}

Qmi8658Config Qmi8658ConfigBuilder::build() const {
    uint8_t ctrl1 = CTRL1_BE;
    if (opts.oscillatorOff) ctrl1 |= CTRL1_SENSOR_DISABLE;
    if (opts.fifoIntOnInt1) ctrl1 |= CTRL1_FIFO_INT_SEL;
    if (opts.int1)          ctrl1 |= CTRL1_INT1_EN;
    if (opts.int2)          ctrl1 |= CTRL1_INT2_EN;
    if (opts.littleEndian)  ctrl1 &= static_cast<uint8_t>(~CTRL1_BE);
    if (opts.autoIncrement) ctrl1 |= CTRL1_ADDR_AI;
    if (opts.threeWire)     ctrl1 |= CTRL1_SIM;

    uint8_t ctrl7 = 0;
    if (opts.accel)        ctrl7 |= CTRL7_AEN;
    if (opts.gyro)         ctrl7 |= CTRL7_GEN;
    if (opts.gyroSnooze)   ctrl7 |= CTRL7_GSN;
    if (opts.dataReadyOff) ctrl7 |= CTRL7_DRDY_DIS;
    if (opts.syncSample)   ctrl7 |= CTRL7_SYNC;

    return Qmi8658Config(ctrl1, ctrl7);
}
