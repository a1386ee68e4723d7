#include "test_harness.hpp"
#include <main/utils/unit_converter.hpp>

static void test_celsius_to_fahrenheit()
{
    EXPECT_NEAR(UnitConverter::celsiusToFahrenheit(0.0f), 32.0, 1e-5);
    EXPECT_NEAR(UnitConverter::celsiusToFahrenheit(100.0f), 212.0, 1e-4);
    EXPECT_NEAR(UnitConverter::celsiusToFahrenheit(-40.0f), -40.0, 1e-4);
    EXPECT_NEAR(UnitConverter::celsiusToFahrenheit(22.0f), 71.6, 1e-4);
    const float samples[] = { -12.5f, 3.25f, 18.0f, 37.5f };
    for (float c : samples)
    {
        EXPECT_NEAR(UnitConverter::celsiusToFahrenheit(c), c * 1.8 + 32.0, 1e-4);
    }
}

static void test_lux_to_foot_candle()
{
    EXPECT_NEAR(UnitConverter::luxToFootCandle(0.0f), 0.0, 1e-6);
    EXPECT_NEAR(UnitConverter::luxToFootCandle(10.764f), 1.0, 1e-6);
    EXPECT_NEAR(UnitConverter::luxToFootCandle(500.0f), 46.451, 1e-3);
    const float samples[] = { 1.0f, 250.0f, 12000.0f, 88000.0f };
    for (float l : samples)
    {
        EXPECT_NEAR(UnitConverter::luxToFootCandle(l), l / 10.764, 1e-3);
    }
}

static void test_moisture_to_scale()
{
    EXPECT_NEAR(UnitConverter::moistureToScale(200), 10.0, 1e-6);
    EXPECT_NEAR(UnitConverter::moistureToScale(2000), 100.0, 1e-6);
    EXPECT_NEAR(UnitConverter::moistureToScale(1000), 50.0, 1e-6);
    EXPECT_NEAR(UnitConverter::moistureToScale(333), 16.65, 1e-5);
}

static void test_moisture_out_of_range_is_not_clamped()
{
    EXPECT_NEAR(UnitConverter::moistureToScale(0), 0.0, 1e-6);
    EXPECT_NEAR(UnitConverter::moistureToScale(100), 5.0, 1e-6);
    EXPECT_NEAR(UnitConverter::moistureToScale(4095), 204.75, 1e-4);
}

static void test_converters_are_idempotent()
{
    EXPECT_TRUE(UnitConverter::celsiusToFahrenheit(21.3f) == UnitConverter::celsiusToFahrenheit(21.3f));
    EXPECT_TRUE(UnitConverter::luxToFootCandle(731.0f) == UnitConverter::luxToFootCandle(731.0f));
    EXPECT_TRUE(UnitConverter::moistureToScale(871) == UnitConverter::moistureToScale(871));
}

static void test_convert_reading()
{
    SensorReading reading{};
    reading.lux = 500.0f;
    reading.moisture_raw = 1000;
    reading.temp_c = 22.0f;
    PlantMeasurement m = UnitConverter::convert(reading);
    EXPECT_NEAR(m.sunlight_fc, 46.45, 0.01);
    EXPECT_NEAR(m.moisture_scale, 50.0, 1e-6);
    EXPECT_NEAR(m.temperature_f, 71.6, 1e-4);
}

int main()
{
    test_celsius_to_fahrenheit();
    test_lux_to_foot_candle();
    test_moisture_to_scale();
    test_moisture_out_of_range_is_not_clamped();
    test_converters_are_idempotent();
    test_convert_reading();
    return test_result("unit_converter_test");
}
