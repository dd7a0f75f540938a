#pragma once

/// @file random_source.hpp
/// @brief Injectable randomness for critical and variance rolls.

#include <cstdint>
#include <random>

namespace elemcore::foundation {

/// Source of uniform random numbers.
///
/// The resolution pipeline draws all of its non-deterministic values
/// through this interface so tests can substitute fixed sequences.
///
/// Implementations are not required to be thread-safe; a source is used
/// by one thread at a time. Mt19937RandomSource does no locking.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform value in [0, 1).
    virtual float NextUnit() = 0;

    /// Uniform value in [min, max]. Returns min when max <= min.
    virtual float Range(float min, float max) = 0;
};

/// Default random source backed by std::mt19937.
class Mt19937RandomSource final : public IRandomSource {
public:
    /// Seed from std::random_device.
    Mt19937RandomSource();

    explicit Mt19937RandomSource(uint32_t seed);

    float NextUnit() override;

    float Range(float min, float max) override;

private:
    std::mt19937 engine_;
};

} // namespace elemcore::foundation
