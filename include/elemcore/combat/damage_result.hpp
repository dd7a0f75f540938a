#pragma once

/// @file damage_result.hpp
/// @brief DamageResult: everything one resolution produced.

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elemcore/combat/attack.hpp"
#include "elemcore/combat/element_types.hpp"
#include "elemcore/combat/resistance_profile.hpp"

namespace elemcore::combat {

/// Eligible on-hit effect reported by a resolution. Applying it is up to
/// the caller.
struct TriggeredEffect {
    std::string effectId;
    ElementType element = ElementType::None;
    std::vector<std::string> statusEffectIds;
    float power = 0.0f;
    float duration = 0.0f;
};

/// Outcome of resolving one attack against one defender.
struct DamageResult {
    float baseDamage = 0.0f;
    float finalDamage = 0.0f;

    /// Element/power pairs actually resolved (the composite pair when composited).
    std::vector<ElementalPower> resolvedParts;
    bool isComposite = false;
    ElementType compositeElement = ElementType::None;

    ResistanceProfile defenseResistances;

    /// Damage per element, accumulated over all pairs of that element.
    std::vector<std::pair<ElementType, float>> breakdown;

    /// Human-readable steps, each prefixed with the step name.
    std::vector<std::string> calculationLog;

    bool isCritical = false;
    float varianceMultiplier = 1.0f;

    std::vector<TriggeredEffect> triggeredEffects;

    /// Damage dealt by one element, 0 if it did not contribute.
    [[nodiscard]] float GetElementDamage(ElementType element) const;

    [[nodiscard]] bool WasElementUsed(ElementType element) const;

    /// Element with the highest breakdown damage (first wins ties), None if empty.
    [[nodiscard]] ElementType GetDominantElement() const;

    /// Add damage to an element's breakdown entry.
    void AccumulateElementDamage(ElementType element, float damage);

    /// Append "[step] message" to the calculation log.
    void AddCalculationLog(std::string_view step, std::string_view message);
};

}  // namespace elemcore::combat
