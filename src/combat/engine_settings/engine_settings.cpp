/// @file engine_settings.cpp
/// @brief EngineSettings config loading.

#include "elemcore/combat/engine_settings.hpp"

#include <string>

namespace elemcore::combat {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

namespace {

/// Overwrite target when key is present. Returns the lookup error for a
/// present key of the wrong type.
template <typename T>
EngineResult<void> readOptional(const ConfigManager& config, const std::string& key, T& target) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (value.hasError()) {
        return EngineResult<void>::err(value.error());
    }
    target = value.value();
    return EngineResult<void>::ok();
}

}  // namespace

EngineResult<EngineSettings> EngineSettings::FromConfig(const ConfigManager& config) {
    EngineSettings settings;

    for (auto result : {
             readOptional(config, "elemental.global_damage_multiplier", settings.globalDamageMultiplier),
             readOptional(config, "elemental.enable_composition", settings.enableComposition),
             readOptional(config, "elemental.enable_environmental_effects",
                          settings.enableEnvironmentalEffects),
             readOptional(config, "elemental.variance_min", settings.varianceMin),
             readOptional(config, "elemental.variance_max", settings.varianceMax),
             readOptional(config, "elemental.max_calculations_per_tick", settings.maxCalculationsPerTick),
         }) {
        if (result.hasError()) {
            return EngineResult<EngineSettings>::err(result.error());
        }
    }

    if (settings.globalDamageMultiplier < 0.0f) {
        return EngineResult<EngineSettings>::err(
            EngineError(ErrorCode::ConfigInvalidValue,
                        "elemental.global_damage_multiplier must not be negative"));
    }
    if (settings.varianceMin > settings.varianceMax) {
        return EngineResult<EngineSettings>::err(
            EngineError(ErrorCode::ConfigInvalidValue,
                        "elemental.variance_min is greater than elemental.variance_max"));
    }
    if (settings.maxCalculationsPerTick <= 0) {
        return EngineResult<EngineSettings>::err(
            EngineError(ErrorCode::ConfigInvalidValue,
                        "elemental.max_calculations_per_tick must be positive"));
    }
    return EngineResult<EngineSettings>::ok(settings);
}

}  // namespace elemcore::combat
