/// @file random_source.cpp
/// @brief Mt19937RandomSource implementation.

#include "elemcore/foundation/random_source.hpp"

namespace elemcore::foundation {

Mt19937RandomSource::Mt19937RandomSource() : engine_(std::random_device{}()) {}

Mt19937RandomSource::Mt19937RandomSource(uint32_t seed) : engine_(seed) {}

float Mt19937RandomSource::NextUnit() {
    // Top 24 bits fill the float mantissa exactly; the largest result is
    // 1 - 2^-24, so 1.0f is unreachable.
    constexpr float kScale = 1.0f / 16777216.0f;
    return static_cast<float>(engine_() >> 8) * kScale;
}

float Mt19937RandomSource::Range(float min, float max) {
    if (max <= min) {
        return min;
    }
    std::uniform_real_distribution<float> dist(min, max);
    return dist(engine_);
}

} // namespace elemcore::foundation
