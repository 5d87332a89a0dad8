#include "qmi8658_config.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <vector>

namespace {

struct Option {
    std::function<Qmi8658ConfigBuilder(const Qmi8658ConfigBuilder&)> apply;
    uint8_t ctrl1Set;
    uint8_t ctrl1Clear;
    uint8_t ctrl7Set;
};

std::vector<Option> allOptions() {
    return {
        {[](const Qmi8658ConfigBuilder& b) { return b.disableInternalOscillator(); }, 0x01, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.fifoInterruptOnInt1(); },       0x04, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.enableInt1(); },                0x08, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.enableInt2(); },                0x10, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.littleEndian(); },              0, 0x20, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.addressAutoIncrement(); },      0x40, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.threeWireBus(); },              0x80, 0, 0},
        {[](const Qmi8658ConfigBuilder& b) { return b.enableAccelerometer(); },       0, 0, 0x01},
        {[](const Qmi8658ConfigBuilder& b) { return b.enableGyroscope(); },           0, 0, 0x02},
        {[](const Qmi8658ConfigBuilder& b) { return b.gyroscopeSnooze(); },           0, 0, 0x10},
        {[](const Qmi8658ConfigBuilder& b) { return b.disableDataReady(); },          0, 0, 0x20},
        {[](const Qmi8658ConfigBuilder& b) { return b.syncSample(); },                0, 0, 0x80},
    };
}

} // namespace

TEST(Qmi8658ConfigTest, DefaultsMatchResetValues) {
    Qmi8658Config c = Qmi8658ConfigBuilder().build();
    EXPECT_EQ(c.ctrl1(), 0b00100000);
    EXPECT_EQ(c.ctrl7(), 0b00000000);
}

TEST(Qmi8658ConfigTest, EachOptionTouchesItsOwnBit) {
    for (const Option& o : allOptions()) {
        Qmi8658Config c = o.apply(Qmi8658ConfigBuilder()).build();
        EXPECT_EQ(c.ctrl1(), (uint8_t)((0x20 | o.ctrl1Set) & ~o.ctrl1Clear));
        EXPECT_EQ(c.ctrl7(), o.ctrl7Set);
    }
}

TEST(Qmi8658ConfigTest, AnySubsetInAnyOrderYieldsTheOrOfMasks) {
    const std::vector<Option> options = allOptions();
    const unsigned n = options.size();

    for (unsigned mask = 0; mask < (1u << n); ++mask) {
        uint8_t ctrl1 = 0x20;
        uint8_t ctrl7 = 0;
        std::vector<unsigned> picked;
        for (unsigned i = 0; i < n; ++i) {
            if (mask & (1u << i)) {
                picked.push_back(i);
                ctrl1 = (uint8_t)((ctrl1 | options[i].ctrl1Set) & ~options[i].ctrl1Clear);
                ctrl7 |= options[i].ctrl7Set;
            }
        }

        Qmi8658ConfigBuilder forward;
        for (unsigned i : picked) forward = options[i].apply(forward);

        Qmi8658ConfigBuilder reverse;
        for (auto it = picked.rbegin(); it != picked.rend(); ++it)
            reverse = options[*it].apply(options[*it].apply(reverse));

        Qmi8658Config a = forward.build();
        Qmi8658Config b = reverse.build();
        ASSERT_EQ(a.ctrl1(), ctrl1) << "mask " << mask;
        ASSERT_EQ(a.ctrl7(), ctrl7) << "mask " << mask;
        ASSERT_EQ(b.ctrl1(), ctrl1) << "mask " << mask;
        ASSERT_EQ(b.ctrl7(), ctrl7) << "mask " << mask;
    }
}

TEST(Qmi8658ConfigTest, OptionsDoNotModifyTheSourceBuilder) {
    Qmi8658ConfigBuilder base;
    Qmi8658ConfigBuilder withAccel = base.enableAccelerometer();

    EXPECT_EQ(base.build().ctrl7(), 0x00);
    EXPECT_EQ(withAccel.build().ctrl7(), 0x01);
}

TEST(Qmi8658ConfigTest, StandardPreset) {
    Qmi8658Config c = Qmi8658ConfigBuilder::standard().build();
    EXPECT_EQ(c.ctrl1(), 0b01100000);
    EXPECT_EQ(c.ctrl7(), 0b00000011);
}

TEST(Qmi8658ConfigTest, FromRegistersKeepsRawBytes) {
    Qmi8658Config c = Qmi8658Config::fromRegisters(0xA5, 0x5A);
    EXPECT_EQ(c.ctrl1(), 0xA5);
    EXPECT_EQ(c.ctrl7(), 0x5A);
}
