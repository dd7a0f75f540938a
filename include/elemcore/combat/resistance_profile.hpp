#pragma once

/// @file resistance_profile.hpp
/// @brief ResistanceProfile: per-element resistance values plus
///        immunity and weakness sets.

#include <algorithm>
#include <utility>
#include <vector>

#include "elemcore/combat/element_types.hpp"

namespace elemcore::combat {

/// Lowest and highest storable resistance value.
constexpr float kMinResistance = -1.0f;
constexpr float kMaxResistance = 1.0f;

/// One source's elemental defense.
///
/// Values are clamped to [-1, 1]: negative amplifies damage (weakness),
/// positive reduces it. Entries keep insertion order so aggregation can
/// break ties by first-seen element.
struct ResistanceProfile {
    std::vector<std::pair<ElementType, float>> resistances;
    ElementType primaryElement = ElementType::None;
    std::vector<ElementType> immunities;
    std::vector<ElementType> weaknesses;

    /// Resistance for an element, 0 when unset.
    [[nodiscard]] float GetResistance(ElementType element) const noexcept {
        for (const auto& [e, value] : resistances) {
            if (e == element) {
                return value;
            }
        }
        return 0.0f;
    }

    /// Set (or overwrite) an element's resistance, clamped to [-1, 1].
    void SetResistance(ElementType element, float value) {
        value = std::clamp(value, kMinResistance, kMaxResistance);
        for (auto& [e, existing] : resistances) {
            if (e == element) {
                existing = value;
                return;
            }
        }
        resistances.emplace_back(element, value);
    }

    void RemoveResistance(ElementType element) {
        std::erase_if(resistances, [element](const auto& entry) { return entry.first == element; });
    }

    [[nodiscard]] bool IsImmune(ElementType element) const noexcept {
        return std::find(immunities.begin(), immunities.end(), element) != immunities.end();
    }

    [[nodiscard]] bool IsWeak(ElementType element) const noexcept {
        return std::find(weaknesses.begin(), weaknesses.end(), element) != weaknesses.end();
    }

    /// Add an immunity. Returns false if already present.
    bool AddImmunity(ElementType element) {
        if (IsImmune(element)) {
            return false;
        }
        immunities.push_back(element);
        return true;
    }

    bool RemoveImmunity(ElementType element) {
        return std::erase(immunities, element) > 0;
    }

    /// Add a weakness. Returns false if already present.
    bool AddWeakness(ElementType element) {
        if (IsWeak(element)) {
            return false;
        }
        weaknesses.push_back(element);
        return true;
    }

    bool RemoveWeakness(ElementType element) {
        return std::erase(weaknesses, element) > 0;
    }

    bool operator==(const ResistanceProfile&) const = default;
};

}  // namespace elemcore::combat
