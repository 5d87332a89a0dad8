#include "i2c_device.hpp"
#include "qmi8658.hpp"

#include <iostream>
#include <chrono>
#include <thread>
#include <memory>
#include <string>
#include <cstdint>

// usage: qmi8658_monitor [device] [address] [samples]
int main(int argc, char** argv) {
    try {
        std::string device = argc > 1 ? argv[1] : "/dev/i2c-1";
        uint8_t address = argc > 2 ? (uint8_t)std::stoul(argv[2], nullptr, 0)
                                   : Qmi8658::DEFAULT_ADDRESS;
        unsigned long count = argc > 3 ? std::stoul(argv[3]) : 0;

        Qmi8658 imu(std::unique_ptr<I2CBus>(new I2CDevice(device)), address);

        if (!imu.begin(Qmi8658ConfigBuilder::standard().build())) {
            std::cerr << "QMI8658 not detected on " << device << "\n";
            return 1;
        }

        std::cout << "QMI8658 initialized.\n";

        // Raw code, 1/256 degC per LSB
        int16_t temp = imu.readTemperature();
        std::cout << "temp_raw=" << temp << " (" << temp / 256.0f << " C)\n";

        // ~100 Hz
        const auto period = std::chrono::milliseconds(10);
        unsigned long printed = 0;

        while (count == 0 || printed < count) {
            ImuSample s;
            try {
                if (imu.readSample(s)) {
                    std::cout << "A: " << s.accelX << " " << s.accelY << " " << s.accelZ
                              << "  G: " << s.gyroX << " " << s.gyroY << " " << s.gyroZ
                              << "\n";
                    ++printed;
                }
            }
            catch (const Qmi8658LatchTimeout& e) {
                std::cerr << e.what() << "\n";
            }

            std::this_thread::sleep_for(period);
        }
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
