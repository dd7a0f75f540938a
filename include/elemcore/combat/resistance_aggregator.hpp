#pragma once

/// @file resistance_aggregator.hpp
/// @brief ResistanceAggregator: combines per-source resistance profiles
///        with diminishing returns.

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elemcore/combat/resistance_profile.hpp"

namespace elemcore::combat {

/// Collects resistance contributions from equipment, passives and
/// temporary effects and folds them into one effective profile.
///
/// Stacking the same element from several sources uses diminishing
/// returns so no amount of gear reaches full immunity:
///   positive sum s -> s / (s + 1)
///   negative sum s -> s / (1 - s)
class ResistanceAggregator {
public:
    using SourceTable = std::vector<std::pair<std::string, ResistanceProfile>>;

    /// Fold source profiles into one. Pure.
    ///
    /// Immunity and weakness sets are unioned. The primary element is the
    /// highest positive effective value (first-seen wins ties), or None.
    [[nodiscard]] static ResistanceProfile Aggregate(const std::vector<ResistanceProfile>& sources);

    /// Diminishing-returns transform of a summed resistance value.
    [[nodiscard]] static float Diminish(float sum) noexcept;

    // ── Source tables ───────────────────────────────────────────────────

    void RegisterEquipment(std::string equipmentId, ResistanceProfile profile);
    bool RemoveEquipment(std::string_view equipmentId);

    void RegisterPassive(std::string passiveId, ResistanceProfile profile);
    bool RemovePassive(std::string_view passiveId);

    void AddTemporary(std::string effectId, ResistanceProfile profile);
    bool RemoveTemporary(std::string_view effectId);
    void ClearTemporary();

    [[nodiscard]] bool HasTemporary(std::string_view effectId) const;

    [[nodiscard]] const SourceTable& Equipment() const noexcept { return equipment_; }
    [[nodiscard]] const SourceTable& Passives() const noexcept { return passives_; }
    [[nodiscard]] const SourceTable& Temporary() const noexcept { return temporary_; }

    /// Aggregate of equipment, passive and temporary sources in that order.
    [[nodiscard]] ResistanceProfile CalculateTotal() const;

    /// Advances on every mutation of a source table.
    [[nodiscard]] uint64_t Version() const noexcept { return version_; }

private:
    void upsert(SourceTable& table, std::string id, ResistanceProfile profile);
    bool erase(SourceTable& table, std::string_view id);

    SourceTable equipment_;
    SourceTable passives_;
    SourceTable temporary_;
    uint64_t version_ = 0;
};

}  // namespace elemcore::combat
