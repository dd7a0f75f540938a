#pragma once

/// @file elemental_combatant.hpp
/// @brief ElementalCombatant: per-entity elemental state.

#include <cstdint>
#include <optional>
#include <string_view>

#include "elemcore/combat/affinity_override_table.hpp"
#include "elemcore/combat/attack_builder.hpp"
#include "elemcore/combat/damage_result.hpp"
#include "elemcore/combat/environment_profile.hpp"
#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/combat/modifier_ledger.hpp"
#include "elemcore/combat/resistance_aggregator.hpp"
#include "elemcore/combat/resistance_profile.hpp"
#include "elemcore/combat/resolution_pipeline.hpp"
#include "elemcore/foundation/signal.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::combat {

/// Elemental state of one combat participant.
///
/// Owns the attack builder, resistance aggregator, affinity overrides and
/// the modifier ledger wired to them. Address-stable: the ledger keeps
/// references into this object, so it is neither copyable nor movable.
class ElementalCombatant {
public:
    explicit ElementalCombatant(foundation::EntityId id);

    ElementalCombatant(const ElementalCombatant&) = delete;
    ElementalCombatant& operator=(const ElementalCombatant&) = delete;
    ElementalCombatant(ElementalCombatant&&) = delete;
    ElementalCombatant& operator=(ElementalCombatant&&) = delete;

    [[nodiscard]] foundation::EntityId Id() const noexcept { return id_; }

    [[nodiscard]] AttackBuilder& Builder() noexcept { return builder_; }
    [[nodiscard]] const AttackBuilder& Builder() const noexcept { return builder_; }
    [[nodiscard]] ResistanceAggregator& Resistances() noexcept { return aggregator_; }
    [[nodiscard]] const ResistanceAggregator& Resistances() const noexcept { return aggregator_; }
    [[nodiscard]] AffinityOverrideTable& Overrides() noexcept { return overrides_; }
    [[nodiscard]] const AffinityOverrideTable& Overrides() const noexcept { return overrides_; }
    [[nodiscard]] ModifierLedger& Modifiers() noexcept { return ledger_; }
    [[nodiscard]] const ModifierLedger& Modifiers() const noexcept { return ledger_; }

    // ── Base profile ────────────────────────────────────────────────────

    void SetBaseResistance(ElementType element, float value);
    void RemoveBaseResistance(ElementType element);
    bool AddImmunity(ElementType element);
    bool RemoveImmunity(ElementType element);
    bool AddWeakness(ElementType element);
    bool RemoveWeakness(ElementType element);

    void SetPrimaryElement(ElementType element);
    [[nodiscard]] ElementType PrimaryElement() const noexcept { return base_.primaryElement; }

    void SetSecondaryElement(ElementType element) noexcept { secondaryElement_ = element; }
    [[nodiscard]] ElementType SecondaryElement() const noexcept { return secondaryElement_; }

    [[nodiscard]] const ResistanceProfile& BaseProfile() const noexcept { return base_; }

    // ── Combat ──────────────────────────────────────────────────────────

    /// Base profile merged with every active resistance source.
    ///
    /// Recomputed only when the base profile, the aggregator or the
    /// ledger changed since the last call.
    [[nodiscard]] const ResistanceProfile& GetElementalDefense() const;

    /// Build an attack, then apply active conversions and the composite
    /// bonus multiplier.
    [[nodiscard]] ElementalAttack CreateElementalAttack(
        const IStatAccessor& stats,
        std::optional<std::string_view> weaponId = std::nullopt,
        std::optional<std::string_view> skillId = std::nullopt) const;

    /// Resolve an incoming attack, apply the damage and offer eligible
    /// on-hit effects to applicator (skipped when nullptr).
    DamageResult TakeElementalDamage(const ResolutionPipeline& pipeline, const ElementalAttack& attack,
                                     IStatAccessor& stats, IStatusEffectApplicator* applicator,
                                     const EnvironmentProfile* environment = nullptr);

    /// Advance modifier, bonus and override durations.
    void Tick(float deltaTime) { ledger_.Tick(deltaTime); }

    /// Fires once per immune element present in a resolved attack.
    foundation::Signal<ElementType> onImmunityTriggered;

    foundation::Signal<const DamageResult&> onDamageTaken;

private:
    struct CacheKey {
        uint64_t ledger = 0;
        uint64_t aggregator = 0;
        uint64_t base = 0;

        bool operator==(const CacheKey&) const = default;
    };

    [[nodiscard]] CacheKey currentKey() const noexcept {
        return {ledger_.Version(), aggregator_.Version(), baseVersion_};
    }

    foundation::EntityId id_;

    AttackBuilder builder_;
    ResistanceAggregator aggregator_;
    AffinityOverrideTable overrides_;
    ModifierLedger ledger_;

    ResistanceProfile base_;
    ElementType secondaryElement_ = ElementType::None;
    uint64_t baseVersion_ = 0;

    mutable std::optional<CacheKey> cacheKey_;
    mutable ResistanceProfile cachedDefense_;
};

}  // namespace elemcore::combat
