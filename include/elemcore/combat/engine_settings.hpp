#pragma once

/// @file engine_settings.hpp
/// @brief Tunables for resolution and world processing.

#include <cstdint>

#include "elemcore/foundation/config_manager.hpp"
#include "elemcore/foundation/engine_result.hpp"

namespace elemcore::combat {

/// Engine-wide tunables, read from the "elemental.*" config keys.
///
/// | Key                                     | Default |
/// |-----------------------------------------|---------|
/// | elemental.global_damage_multiplier      | 1.0     |
/// | elemental.enable_composition            | true    |
/// | elemental.enable_environmental_effects  | true    |
/// | elemental.variance_min                  | 0.95    |
/// | elemental.variance_max                  | 1.05    |
/// | elemental.max_calculations_per_tick     | 50      |
struct EngineSettings {
    float globalDamageMultiplier = 1.0f;
    bool enableComposition = true;
    bool enableEnvironmentalEffects = true;
    float varianceMin = 0.95f;
    float varianceMax = 1.05f;
    int32_t maxCalculationsPerTick = 50;

    /// Missing keys keep their defaults.
    /// @return ConfigTypeMismatch for a mistyped key, ConfigInvalidValue
    ///         for a negative multiplier, variance_min > variance_max or a
    ///         non-positive per-tick budget.
    static foundation::EngineResult<EngineSettings> FromConfig(const foundation::ConfigManager& config);
};

}  // namespace elemcore::combat
