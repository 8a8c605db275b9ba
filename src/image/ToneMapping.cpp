#include "ToneMapping.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace roi_capture {

    // Narkowicz ACES filmic fit
    float ToneMap_ACES(float x) {
        constexpr float a = 2.51f, b = 0.03f, c = 2.43f, d = 0.59f, e = 0.14f;
        x = std::max(x, 0.0f);
        return std::clamp((x * (a * x + b)) / (x * (c * x + d) + e), 0.0f, 1.0f);
    }

    float ToneMap_Reinhard(float x) {
        x = std::max(x, 0.0f);
        return x / (1.0f + x);
    }

    float LinearToSRGB(float linear) {
        if (linear <= 0.0031308f) return 12.92f * linear;
        return 1.055f * std::pow(linear, 1.0f / 2.4f) - 0.055f;
    }

    float HalfToFloat(std::uint16_t h) {
        const float sign = (h & 0x8000) ? -1.0f : 1.0f;
        const int exponent = (h >> 10) & 0x1F;
        const int mantissa = h & 0x03FF;

        if (exponent == 0) {
            // zero / subnormal: mantissa * 2^-24
            return sign * std::ldexp(static_cast<float>(mantissa), -24);
        }
        if (exponent == 0x1F) {
            return mantissa ? std::numeric_limits<float>::quiet_NaN()
                            : sign * std::numeric_limits<float>::infinity();
        }
        return sign * std::ldexp(static_cast<float>(mantissa | 0x0400), exponent - 25);
    }

} // namespace roi_capture
