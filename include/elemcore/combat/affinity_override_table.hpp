#pragma once

/// @file affinity_override_table.hpp
/// @brief Time-bounded per-pair affinity replacements.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elemcore/combat/element_types.hpp"

namespace elemcore::combat {

/// A replacement multiplier for one (attack, defense) pair.
struct AffinityOverride {
    ElementType attackElement = ElementType::None;
    ElementType defenseElement = ElementType::None;
    float newAffinity = 1.0f;
    std::optional<float> remainingDuration;  ///< nullopt = permanent.
    std::string sourceId;

    [[nodiscard]] bool IsPermanent() const noexcept { return !remainingDuration.has_value(); }

    bool operator==(const AffinityOverride&) const = default;
};

/// Active affinity overrides keyed by override id.
///
/// Lookups consult this table before the static AffinityTable. When more
/// than one active override targets the same pair, the most recently
/// added one wins.
class AffinityOverrideTable {
public:
    /// Add or replace an override.
    /// @param duration Seconds until expiry; nullopt for permanent.
    void AddOverride(std::string overrideId, ElementType attack, ElementType defense,
                     float newAffinity, std::optional<float> duration = std::nullopt,
                     std::string sourceId = {});

    /// Remove one override. Returns false if the id is unknown.
    bool RemoveOverride(std::string_view overrideId);

    /// Remove every override tagged with the source. Returns the count.
    std::size_t RemoveOverridesBySource(std::string_view sourceId);

    /// Override for the pair, if any.
    [[nodiscard]] std::optional<float> GetOverride(ElementType attack, ElementType defense) const;

    /// Override for the pair, or original when none is active.
    [[nodiscard]] float GetModifiedAffinity(ElementType attack, ElementType defense,
                                            float original) const {
        return GetOverride(attack, defense).value_or(original);
    }

    /// Decrement timed overrides and drop the ones reaching zero.
    void Tick(float deltaTime);

    [[nodiscard]] bool HasOverride(std::string_view overrideId) const;

    [[nodiscard]] const std::vector<std::pair<std::string, AffinityOverride>>& GetActiveOverrides() const noexcept {
        return overrides_;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return overrides_.size(); }

    void Clear();

    /// Advances on every change to the table.
    [[nodiscard]] uint64_t Version() const noexcept { return version_; }

private:
    std::vector<std::pair<std::string, AffinityOverride>> overrides_;
    uint64_t version_ = 0;
};

}  // namespace elemcore::combat
