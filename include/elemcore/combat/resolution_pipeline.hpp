#pragma once

/// @file resolution_pipeline.hpp
/// @brief ResolutionPipeline: turns an attack and a defense into damage.

#include "elemcore/combat/affinity_override_table.hpp"
#include "elemcore/combat/attack.hpp"
#include "elemcore/combat/damage_result.hpp"
#include "elemcore/combat/element_database.hpp"
#include "elemcore/combat/engine_settings.hpp"
#include "elemcore/combat/environment_profile.hpp"
#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/combat/resistance_profile.hpp"
#include "elemcore/foundation/random_source.hpp"

namespace elemcore::combat {

/// Stateless damage resolution over shared rule data.
///
/// Steps, in order:
///   1. Base damage: attacker Offense when attributed, else raw total power.
///   2. Composition of multi-element attacks.
///   3. Defense lookup (none = zero resistance).
///   4. Per-pair damage: affinity, resistance, immunity, environment.
///   5. Critical roll, variance and the global damage multiplier.
///   6. Eligible on-hit effects.
///
/// Each step appends to DamageResult::calculationLog.
///
/// Resolve reads the rule data and the defender without mutating them, but
/// every roll advances a random source. The overloads without a source
/// draw from the one given at construction and must stay on one thread.
/// Hosts resolving different targets in parallel pass a per-thread source
/// to the overload that takes one.
class ResolutionPipeline {
public:
    /// @param stats Attacker stat source; nullptr treats every attack as
    ///              unattributed for stat lookups.
    ResolutionPipeline(const ElementDatabase& database, foundation::IRandomSource& random,
                       EngineSettings settings = {}, const IStatAccessor* stats = nullptr);

    /// Resolve attack against a defense.
    /// @param defense   Merged defender profile; nullptr = no resistances.
    /// @param overrides Defender's affinity overrides, consulted before the
    ///                  static table.
    /// @param environment Active environment, if any.
    [[nodiscard]] DamageResult Resolve(const ElementalAttack& attack,
                                       const ResistanceProfile* defense,
                                       const AffinityOverrideTable* overrides = nullptr,
                                       const EnvironmentProfile* environment = nullptr) const;

    /// Resolve drawing critical and variance rolls from random instead of
    /// the pipeline's own source.
    [[nodiscard]] DamageResult Resolve(const ElementalAttack& attack,
                                       const ResistanceProfile* defense,
                                       const AffinityOverrideTable* overrides,
                                       const EnvironmentProfile* environment,
                                       foundation::IRandomSource& random) const;

    [[nodiscard]] DamageResult Resolve(const ElementalAttack& attack,
                                       const ResistanceProfile& defense,
                                       const EnvironmentProfile* environment = nullptr) const {
        return Resolve(attack, &defense, nullptr, environment);
    }

    /// Merge a base profile with aggregated modifier resistances.
    ///
    /// Values add and clamp to [-1, 1]; immunity and weakness sets are
    /// unioned; the base primary element wins unless it is None.
    [[nodiscard]] static ResistanceProfile MergeDefense(const ResistanceProfile& base,
                                                        const ResistanceProfile& aggregated);

    [[nodiscard]] const EngineSettings& Settings() const noexcept { return settings_; }
    void SetSettings(const EngineSettings& settings) { settings_ = settings; }

    void SetStatAccessor(const IStatAccessor* stats) noexcept { stats_ = stats; }

private:
    float baseDamage(const ElementalAttack& attack, DamageResult& result) const;
    ElementalAttack compose(const ElementalAttack& attack, DamageResult& result) const;
    float elementDamage(ElementType element, float power, const ResistanceProfile& defense,
                        const AffinityOverrideTable* overrides,
                        const EnvironmentProfile* environment, DamageResult& result) const;
    float postModifiers(float damage, const ElementalAttack& attack, foundation::IRandomSource& random,
                        DamageResult& result) const;
    void collectEffects(DamageResult& result) const;

    /// Stat of the attacker, neutral when unavailable (noted in the log).
    float attackerStat(const ElementalAttack& attack, StatKind kind, DamageResult& result) const;

    const ElementDatabase& database_;
    foundation::IRandomSource& random_;
    EngineSettings settings_;
    const IStatAccessor* stats_ = nullptr;
};

}  // namespace elemcore::combat
