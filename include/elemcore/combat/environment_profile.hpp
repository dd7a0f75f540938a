#pragma once

/// @file environment_profile.hpp
/// @brief EnvironmentProfile: battlefield-wide elemental conditions.

#include <string>
#include <utility>
#include <vector>

#include "elemcore/combat/element_types.hpp"
#include "elemcore/combat/modifier.hpp"

namespace elemcore::combat {

/// Damage scaling an environment applies to one element.
struct EnvironmentDamageModifier {
    ElementType element = ElementType::None;
    float damageMultiplier = 1.0f;
    float powerBonus = 0.0f;
};

/// Status effect an environment may inflict after a resolution.
struct AmbientEffect {
    ElementType element = ElementType::None;
    std::string statusEffectId;
    float applicationChance = 0.1f;
    std::vector<ElementType> immuneElements;  ///< Attacks carrying these are unaffected.
};

/// Elemental conditions of an area (volcano, storm, ...).
///
/// While active, every per-element term of a resolution passes through
/// the damage modifier and global resistance for that element, and each
/// combatant carries the listed modifiers tagged with the profile id.
struct EnvironmentProfile {
    std::string id;
    std::string name;
    std::vector<std::pair<ElementType, float>> globalResistances;
    std::vector<EnvironmentDamageModifier> damageModifiers;
    std::vector<AmbientEffect> ambientEffects;
    std::vector<Modifier> modifiers;

    [[nodiscard]] float GetDamageMultiplier(ElementType element) const {
        for (const auto& modifier : damageModifiers) {
            if (modifier.element == element) {
                return modifier.damageMultiplier;
            }
        }
        return 1.0f;
    }

    [[nodiscard]] float GetPowerBonus(ElementType element) const {
        for (const auto& modifier : damageModifiers) {
            if (modifier.element == element) {
                return modifier.powerBonus;
            }
        }
        return 0.0f;
    }

    [[nodiscard]] float GetResistance(ElementType element) const {
        for (const auto& [e, value] : globalResistances) {
            if (e == element) {
                return value;
            }
        }
        return 0.0f;
    }
};

}  // namespace elemcore::combat
