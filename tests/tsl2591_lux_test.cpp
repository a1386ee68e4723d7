#include "test_harness.hpp"
#include <main/hardware/tsl2591_lux.hpp>

using Tsl2591Lux::Gain;
using Tsl2591Lux::Integration;

static void test_gain_and_integration_tables()
{
    EXPECT_NEAR(Tsl2591Lux::gainMultiplier(Gain::LOW), 1.0, 1e-6);
    EXPECT_NEAR(Tsl2591Lux::gainMultiplier(Gain::MED), 25.0, 1e-6);
    EXPECT_NEAR(Tsl2591Lux::gainMultiplier(Gain::HIGH), 428.0, 1e-6);
    EXPECT_NEAR(Tsl2591Lux::gainMultiplier(Gain::MAX), 9876.0, 1e-6);
    EXPECT_EQ_INT(Tsl2591Lux::integrationMs(Integration::MS_100), 100);
    EXPECT_EQ_INT(Tsl2591Lux::integrationMs(Integration::MS_600), 600);
}

static void test_compute()
{
    float lux = -1.0f;
    EXPECT_TRUE(Tsl2591Lux::compute(1000, 200, Gain::MED, Integration::MS_100, lux));
    EXPECT_NEAR(lux, 104.448, 0.01);

    // Longer integration collects proportionally more counts per lux
    float lux_long = -1.0f;
    EXPECT_TRUE(Tsl2591Lux::compute(1000, 200, Gain::MED, Integration::MS_200, lux_long));
    EXPECT_NEAR(lux_long, lux / 2.0f, 0.01);
}

static void test_dark_and_saturated()
{
    float lux = -1.0f;
    EXPECT_TRUE(Tsl2591Lux::compute(0, 0, Gain::LOW, Integration::MS_100, lux));
    EXPECT_NEAR(lux, 0.0, 1e-6);

    EXPECT_FALSE(Tsl2591Lux::compute(0xFFFF, 10, Gain::LOW, Integration::MS_100, lux));
    EXPECT_FALSE(Tsl2591Lux::compute(10, 0xFFFF, Gain::LOW, Integration::MS_100, lux));
}

int main()
{
    test_gain_and_integration_tables();
    test_compute();
    test_dark_and_saturated();
    return test_result("tsl2591_lux_test");
}
