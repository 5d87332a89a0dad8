#pragma once
#include <cstdint>

// Packed CTRL1 / CTRL7 values. Immutable once built.
class Qmi8658Config {
public:
    static Qmi8658Config fromRegisters(uint8_t ctrl1, uint8_t ctrl7) {
        return Qmi8658Config(ctrl1, ctrl7);
    }

    uint8_t ctrl1() const { return c1; }
    uint8_t ctrl7() const { return c7; }

private:
    friend class Qmi8658ConfigBuilder;
    Qmi8658Config(uint8_t ctrl1, uint8_t ctrl7) : c1(ctrl1), c7(ctrl7) {}

    uint8_t c1;
    uint8_t c7;
};

// Composable sensor options. Each call returns a new builder and touches one
// option only, so order and repetition do not change the result of build().
class Qmi8658ConfigBuilder {
public:
    Qmi8658ConfigBuilder() = default;

    // Auto-increment on, accelerometer and gyroscope enabled.
    static Qmi8658ConfigBuilder standard();

    // CTRL1
    Qmi8658ConfigBuilder disableInternalOscillator() const;
    Qmi8658ConfigBuilder fifoInterruptOnInt1() const;
    Qmi8658ConfigBuilder enableInt1() const;
    Qmi8658ConfigBuilder enableInt2() const;
    Qmi8658ConfigBuilder littleEndian() const;
    Qmi8658ConfigBuilder addressAutoIncrement() const;
    Qmi8658ConfigBuilder threeWireBus() const;

    // CTRL7
    Qmi8658ConfigBuilder enableAccelerometer() const;
    Qmi8658ConfigBuilder enableGyroscope() const;
    Qmi8658ConfigBuilder gyroscopeSnooze() const;
    Qmi8658ConfigBuilder disableDataReady() const;
    Qmi8658ConfigBuilder syncSample() const;

    Qmi8658Config build() const;

private:
    struct Options {
        bool oscillatorOff = false;
        bool fifoIntOnInt1 = false;
        bool int1 = false;
        bool int2 = false;
        bool littleEndian = false;
        bool autoIncrement = false;
        bool threeWire = false;

        bool accel = false;
        bool gyro = false;
        bool gyroSnooze = false;
        bool dataReadyOff = false;
        bool syncSample = false;
    } opts;
};
