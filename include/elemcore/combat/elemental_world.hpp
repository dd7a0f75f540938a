#pragma once

/// @file elemental_world.hpp
/// @brief ElementalWorld: combatant registry, environment and damage
///        resolution for one simulated session.

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "elemcore/combat/element_database.hpp"
#include "elemcore/combat/elemental_combatant.hpp"
#include "elemcore/combat/engine_settings.hpp"
#include "elemcore/combat/environment_profile.hpp"
#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/combat/resolution_pipeline.hpp"
#include "elemcore/foundation/engine_result.hpp"
#include "elemcore/foundation/random_source.hpp"
#include "elemcore/foundation/signal.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::combat {

/// Callback receiving the result of a queued resolution.
using ResolutionCallback = std::function<void(const DamageResult&)>;

/// One simulated session of elemental combat.
///
/// Constructed explicitly and passed by reference; there is no global
/// instance. All methods run on the session's evaluation thread.
///
/// Example:
/// @code
///   ElementalWorld world(ElementDatabase::CreateDefault(), stats);
///   auto& hero = world.RegisterCombatant(EntityId(1));
///   auto& slime = world.RegisterCombatant(EntityId(2));
///   auto attack = hero.CreateElementalAttack(stats, "flame_sword");
///   auto result = world.ApplyElementalDamage(attack, slime.Id());
///   world.Tick(0.016f);
/// @endcode
class ElementalWorld {
public:
    /// @param random Random source for rolls; nullptr uses a seeded
    ///               Mt19937RandomSource.
    ElementalWorld(ElementDatabase database, IStatAccessor& stats, EngineSettings settings = {},
                   std::unique_ptr<foundation::IRandomSource> random = nullptr);

    ElementalWorld(const ElementalWorld&) = delete;
    ElementalWorld& operator=(const ElementalWorld&) = delete;

    void SetStatusEffectApplicator(IStatusEffectApplicator* applicator) noexcept {
        applicator_ = applicator;
    }

    [[nodiscard]] ElementDatabase& Database() noexcept { return database_; }
    [[nodiscard]] const ElementDatabase& Database() const noexcept { return database_; }
    [[nodiscard]] const ResolutionPipeline& Pipeline() const noexcept { return pipeline_; }

    // ── Combatants ──────────────────────────────────────────────────────

    /// Create the combatant for id. An existing registration is replaced
    /// (with a warning). Active environment modifiers are applied.
    ElementalCombatant& RegisterCombatant(foundation::EntityId id);

    bool UnregisterCombatant(foundation::EntityId id);

    [[nodiscard]] ElementalCombatant* GetCombatant(foundation::EntityId id);
    [[nodiscard]] const ElementalCombatant* GetCombatant(foundation::EntityId id) const;

    [[nodiscard]] std::size_t CombatantCount() const noexcept { return combatants_.size(); }

    /// Combatants whose primary or secondary element matches, by id.
    [[nodiscard]] std::vector<ElementalCombatant*> GetCombatantsByElement(ElementType element);

    // ── Environment ─────────────────────────────────────────────────────

    /// Store a profile in the database for later SetEnvironment(id).
    void RegisterEnvironment(EnvironmentProfile environment);

    /// Activate a registered environment.
    /// @return EnvironmentNotFound if the id is unknown; the current
    ///         environment is left unchanged.
    foundation::EngineResult<void> SetEnvironment(std::string_view environmentId);

    /// Activate an ad-hoc environment.
    void SetEnvironment(EnvironmentProfile environment);

    void ClearEnvironment();

    /// Active environment, nullptr if none.
    [[nodiscard]] const EnvironmentProfile* CurrentEnvironment() const noexcept {
        return currentEnvironment_ ? &*currentEnvironment_ : nullptr;
    }

    // ── Damage ──────────────────────────────────────────────────────────

    /// Clamped to >= 0.
    void SetGlobalDamageMultiplier(float multiplier);
    [[nodiscard]] float GlobalDamageMultiplier() const noexcept {
        return pipeline_.Settings().globalDamageMultiplier;
    }

    /// Resolve without applying damage.
    /// @return CombatantNotFound if target is not registered.
    [[nodiscard]] foundation::EngineResult<DamageResult> CalculateElementalDamage(
        const ElementalAttack& attack, foundation::EntityId target) const;

    /// Resolve, apply damage and effects, then roll ambient reactions.
    /// @return CombatantNotFound if target is not registered.
    foundation::EngineResult<DamageResult> ApplyElementalDamage(const ElementalAttack& attack,
                                                                foundation::EntityId target);

    /// Queue an ApplyElementalDamage for the next ProcessPending().
    void QueueResolution(ElementalAttack attack, foundation::EntityId target,
                         ResolutionCallback callback = nullptr);

    /// Resolve at most maxCalculationsPerTick queued attacks.
    /// @return Number resolved.
    std::size_t ProcessPending();

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pending_.size(); }

    // ── Modifiers ───────────────────────────────────────────────────────

    /// Give every combatant a copy of modifier with id "{id}_{entity}".
    void ApplyModifierToAll(const Modifier& modifier);

    /// Remove modifiers of sourceId from every combatant. Returns the count.
    std::size_t RemoveModifiersBySource(std::string_view sourceId);

    /// Tick every combatant, then drain the pending queue.
    void Tick(float deltaTime);

    foundation::Signal<foundation::EntityId> onCombatantRegistered;
    foundation::Signal<foundation::EntityId> onCombatantUnregistered;
    foundation::Signal<const EnvironmentProfile*> onEnvironmentChanged;
    foundation::Signal<foundation::EntityId, const DamageResult&> onDamageCalculated;

private:
    struct PendingResolution {
        ElementalAttack attack;
        foundation::EntityId target;
        ResolutionCallback callback;
    };

    void activateEnvironment(std::optional<EnvironmentProfile> environment);
    void applyEnvironmentModifiers(ElementalCombatant& combatant, const EnvironmentProfile& environment);
    void processAmbientReactions(const DamageResult& result, foundation::EntityId target);

    ElementDatabase database_;
    IStatAccessor& stats_;
    IStatusEffectApplicator* applicator_ = nullptr;
    std::unique_ptr<foundation::IRandomSource> random_;
    ResolutionPipeline pipeline_;

    std::unordered_map<foundation::EntityId, std::unique_ptr<ElementalCombatant>> combatants_;
    std::optional<EnvironmentProfile> currentEnvironment_;
    std::deque<PendingResolution> pending_;
};

}  // namespace elemcore::combat
