#ifndef TSL2591_LUX_HPP
#define TSL2591_LUX_HPP

#include <cstdint>

// TSL2591 gain and integration settings plus the lux formula.
// Bus-independent so it can be checked off-target.
namespace Tsl2591Lux {
    enum class Gain : uint8_t {
        LOW  = 0x00, // 1x
        MED  = 0x10, // 25x
        HIGH = 0x20, // 428x
        MAX  = 0x30  // 9876x
    };

    enum class Integration : uint8_t {
        MS_100 = 0x00,
        MS_200 = 0x01,
        MS_300 = 0x02,
        MS_400 = 0x03,
        MS_500 = 0x04,
        MS_600 = 0x05
    };

    float gainMultiplier(Gain gain);
    uint32_t integrationMs(Integration integration);

    // Returns false when either channel is saturated (0xFFFF).
    bool compute(uint16_t ch0_full, uint16_t ch1_ir, Gain gain, Integration integration, float& out_lux);
}

#endif // TSL2591_LUX_HPP
