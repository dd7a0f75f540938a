#pragma once

/// @file external_interfaces.hpp
/// @brief Collaborators the engine calls but does not own: character
///        stats and status effects.

#include <cstdint>
#include <optional>
#include <string_view>

#include "elemcore/combat/element_types.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::combat {

/// Stats the engine reads from an attacker.
enum class StatKind : uint8_t {
    Offense,
    MagicPower,
    CriticalRate,    ///< Probability in [0, 1].
    CriticalDamage   ///< Multiplier applied on a critical hit.
};

/// Neutral value used when a stat is not provided.
constexpr float neutralStat(StatKind kind) noexcept {
    return kind == StatKind::CriticalDamage ? 1.0f : 0.0f;
}

/// Read/write access to a character's stats.
class IStatAccessor {
public:
    virtual ~IStatAccessor() = default;

    /// The stat value, or nullopt when the entity does not provide it.
    [[nodiscard]] virtual std::optional<float> GetStat(foundation::EntityId entity,
                                                       StatKind kind) const = 0;

    virtual void ApplyDamage(foundation::EntityId entity, float amount) = 0;
};

/// Status-effect system offered on-hit and ambient effects.
class IStatusEffectApplicator {
public:
    virtual ~IStatusEffectApplicator() = default;

    /// Returns true if the effect was applied.
    virtual bool TryApplyEffect(std::string_view effectId, ElementType element,
                                foundation::EntityId target) = 0;
};

}  // namespace elemcore::combat
