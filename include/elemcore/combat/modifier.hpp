#pragma once

/// @file modifier.hpp
/// @brief Modifier: a timed or permanent elemental rule change with one
///        typed effect.

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "elemcore/combat/element_types.hpp"

namespace elemcore::combat {

/// Per-element flat and percentage amounts.
struct ElementalValue {
    ElementType element = ElementType::None;
    float flatValue = 0.0f;
    float percentageValue = 0.0f;

    bool operator==(const ElementalValue&) const = default;
};

/// One (attack, defense) -> multiplier replacement carried by a modifier.
struct AffinityOverrideData {
    ElementType attackElement = ElementType::None;
    ElementType defenseElement = ElementType::None;
    float newAffinity = 1.0f;

    bool operator==(const AffinityOverrideData&) const = default;
};

/// Converts power of one element into another at attack-build time.
struct ElementalConversionRule {
    ElementType sourceElement = ElementType::None;
    ElementType targetElement = ElementType::None;
    float conversionPercentage = 100.0f;
    bool additive = false;  ///< true = add alongside the source, false = replace it.

    bool operator==(const ElementalConversionRule&) const = default;
};

// ── Effects ─────────────────────────────────────────────────────────────

/// Extra outgoing elemental power (flat + percentage of MagicPower).
struct AttackBonusEffect {
    std::vector<ElementalValue> bonuses;
};

/// Extra resistance; only flatValue is used.
struct DefenseResistanceEffect {
    std::vector<ElementalValue> resistances;
};

struct AffinityOverrideEffect {
    std::vector<AffinityOverrideData> overrides;
};

struct ElementalConversionEffect {
    ElementalConversionRule rule;
};

/// Multiplies composite power while active.
struct CompositeBonusEffect {
    float multiplier = 1.0f;
};

using ModifierEffect = std::variant<AttackBonusEffect,
                                    DefenseResistanceEffect,
                                    AffinityOverrideEffect,
                                    ElementalConversionEffect,
                                    CompositeBonusEffect>;

/// Kind tag matching the ModifierEffect alternative order.
enum class ModifierKind : uint8_t {
    AttackBonus,
    DefenseResistance,
    AffinityOverride,
    ElementalConversion,
    CompositeBonus
};

constexpr std::string_view modifierKindName(ModifierKind kind) {
    switch (kind) {
        case ModifierKind::AttackBonus:         return "AttackBonus";
        case ModifierKind::DefenseResistance:   return "DefenseResistance";
        case ModifierKind::AffinityOverride:    return "AffinityOverride";
        case ModifierKind::ElementalConversion: return "ElementalConversion";
        case ModifierKind::CompositeBonus:      return "CompositeBonus";
    }
    return "Unknown";
}

/// A unit of dynamic elemental rule change.
///
/// Created by the caller and handed to a ModifierLedger, which applies
/// its side effect immediately and decrements remainingDuration on every
/// tick unless the modifier is permanent.
struct Modifier {
    std::string id;
    std::string sourceId;
    std::string displayName;

    bool isPermanent = false;
    float remainingDuration = 0.0f;
    float originalDuration = 0.0f;

    bool allowStacking = false;
    int32_t maxStacks = 1;
    int32_t currentStacks = 1;

    ModifierEffect effect;

    [[nodiscard]] ModifierKind Kind() const noexcept {
        return static_cast<ModifierKind>(effect.index());
    }

    [[nodiscard]] bool IsExpired() const noexcept {
        return !isPermanent && remainingDuration <= 0.0f;
    }

    /// Remaining fraction of the original duration; 1 for permanent.
    [[nodiscard]] float DurationPercentage() const noexcept {
        if (isPermanent) {
            return 1.0f;
        }
        if (originalDuration <= 0.0f) {
            return 0.0f;
        }
        return std::clamp(remainingDuration / originalDuration, 0.0f, 1.0f);
    }

    void RefreshDuration() noexcept { remainingDuration = originalDuration; }

    /// Returns false when stacking is disabled or already at maxStacks.
    bool AddStack() noexcept {
        if (!allowStacking || currentStacks >= maxStacks) {
            return false;
        }
        ++currentStacks;
        return true;
    }

    bool RemoveStack() noexcept {
        if (currentStacks <= 1) {
            return false;
        }
        --currentStacks;
        return true;
    }
};

}  // namespace elemcore::combat
