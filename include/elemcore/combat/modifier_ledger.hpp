#pragma once

/// @file modifier_ledger.hpp
/// @brief ModifierLedger: lifecycle of active modifiers and dispatch of
///        their side effects into the per-entity tables.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "elemcore/combat/affinity_override_table.hpp"
#include "elemcore/combat/attack_builder.hpp"
#include "elemcore/combat/modifier.hpp"
#include "elemcore/combat/resistance_aggregator.hpp"
#include "elemcore/foundation/engine_result.hpp"
#include "elemcore/foundation/signal.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::combat {

/// Tracks active modifiers of one entity.
///
/// Each kind is dispatched into the table that owns its effect:
///   AttackBonus         -> AttackBuilder skill bonuses keyed by modifier id
///   DefenseResistance   -> ResistanceAggregator temporary profile keyed by modifier id
///   AffinityOverride    -> AffinityOverrideTable keys "{id}_{attack}_{defense}"
///   ElementalConversion -> kept here, read at attack-build time
///   CompositeBonus      -> kept here, read at attack-build time
///
/// The referenced tables must outlive the ledger.
class ModifierLedger {
public:
    ModifierLedger(AttackBuilder& builder, ResistanceAggregator& aggregator,
                   AffinityOverrideTable& overrides,
                   std::optional<foundation::EntityId> owner = std::nullopt);

    ModifierLedger(const ModifierLedger&) = delete;
    ModifierLedger& operator=(const ModifierLedger&) = delete;

    /// Apply a modifier. An active modifier with the same id is torn down
    /// first; when stacking is allowed its stack count carries over plus
    /// one, capped at maxStacks.
    /// @return InvalidModifier for an empty id or maxStacks < 1.
    foundation::EngineResult<void> Apply(Modifier modifier);

    /// Revert and forget a modifier. Returns false if it is not active.
    bool Remove(std::string_view modifierId);

    /// Remove every modifier with the given source id. Returns the count.
    std::size_t RemoveBySource(std::string_view sourceId);

    /// Advance durations and expire modifiers reaching zero, then tick the
    /// attack builder and the override table.
    ///
    /// Expired modifiers are reported through onExpired only.
    void Tick(float deltaTime);

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] const std::vector<Modifier>& GetActiveModifiers() const noexcept { return active_; }

    [[nodiscard]] std::vector<Modifier> GetModifiersBySource(std::string_view sourceId) const;

    [[nodiscard]] bool HasModifier(std::string_view modifierId) const;

    /// Active modifier by id, nullptr if absent.
    [[nodiscard]] const Modifier* GetModifier(std::string_view modifierId) const;

    void ClearAll();

    /// Remove every modifier of one kind. Returns the count.
    std::size_t ClearByKind(ModifierKind kind);

    // ── Bulk registration ───────────────────────────────────────────────

    /// Apply modifiers granted by equipment; all are forced permanent.
    foundation::EngineResult<void> RegisterEquipmentModifiers(std::string_view equipmentId,
                                                              std::vector<Modifier> modifiers);

    /// Apply modifiers granted by a buff for the given duration.
    foundation::EngineResult<void> RegisterBuffModifiers(std::string_view buffId,
                                                         std::vector<Modifier> modifiers,
                                                         float duration);

    /// Apply modifiers granted by a skill. A negative duration is permanent.
    foundation::EngineResult<void> RegisterSkillModifiers(std::string_view skillId,
                                                          std::vector<Modifier> modifiers,
                                                          float duration);

    // ── Build-time effects ──────────────────────────────────────────────

    /// Conversion rules of active ElementalConversion modifiers, in
    /// application order.
    [[nodiscard]] std::vector<ElementalConversionRule> GetConversionRules() const;

    /// Product of active CompositeBonus multipliers (1 when none).
    [[nodiscard]] float GetCompositeBonusMultiplier() const;

    /// Advances whenever the set of active modifiers changes.
    [[nodiscard]] uint64_t Version() const noexcept { return version_; }

    foundation::Signal<const Modifier&> onApplied;
    foundation::Signal<const Modifier&> onRemoved;
    foundation::Signal<const Modifier&> onExpired;

private:
    void dispatch(const Modifier& modifier);
    void revert(const Modifier& modifier);

    /// Revert and erase without emitting; returns the detached modifier.
    std::optional<Modifier> detach(std::string_view modifierId);

    foundation::EngineResult<void> applyAll(std::string_view sourceId,
                                            std::vector<Modifier> modifiers,
                                            std::optional<float> duration);

    void logModifier(std::string_view message, const Modifier& modifier) const;

    AttackBuilder& builder_;
    ResistanceAggregator& aggregator_;
    AffinityOverrideTable& overrides_;
    std::optional<foundation::EntityId> owner_;

    std::vector<Modifier> active_;
    uint64_t version_ = 0;
};

/// Override table key for one entry of an AffinityOverride modifier.
[[nodiscard]] std::string affinityOverrideKey(std::string_view modifierId, ElementType attack,
                                              ElementType defense);

}  // namespace elemcore::combat
