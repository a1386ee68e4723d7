#include <main/hardware/tsl2591_lux.hpp>

// Lux coefficient from the TSL2591 application note
static constexpr float LUX_DF = 408.0f;
static constexpr uint16_t CHANNEL_SATURATED = 0xFFFF;

namespace Tsl2591Lux {
    float gainMultiplier(Gain gain) {
        switch (gain) {
            case Gain::LOW:  return 1.0f;
            case Gain::MED:  return 25.0f;
            case Gain::HIGH: return 428.0f;
            case Gain::MAX:  return 9876.0f;
        }
        return 1.0f;
    }

    uint32_t integrationMs(Integration integration) {
        return 100U * (static_cast<uint32_t>(integration) + 1U);
    }

    bool compute(uint16_t ch0_full, uint16_t ch1_ir, Gain gain, Integration integration, float& out_lux) {
        if (ch0_full == CHANNEL_SATURATED || ch1_ir == CHANNEL_SATURATED) {
            return false;
        }
        if (ch0_full == 0) {
            out_lux = 0.0f;
            return true;
        }
        const float atime = static_cast<float>(integrationMs(integration));
        const float cpl = (atime * gainMultiplier(gain)) / LUX_DF;
        const float ch0 = static_cast<float>(ch0_full);
        const float ch1 = static_cast<float>(ch1_ir);
        out_lux = ((ch0 - ch1) * (1.0f - (ch1 / ch0))) / cpl;
        return true;
    }
}
