/// @file elemental_world.cpp
/// @brief ElementalWorld implementation.

#include "elemcore/combat/elemental_world.hpp"

#include <algorithm>
#include <string>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::EntityId;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

EngineError combatantNotFound(EntityId id) {
    return EngineError(ErrorCode::CombatantNotFound,
                       "combatant not registered: " + std::to_string(id.value()), id);
}

}  // namespace

ElementalWorld::ElementalWorld(ElementDatabase database, IStatAccessor& stats,
                               EngineSettings settings,
                               std::unique_ptr<foundation::IRandomSource> random)
    : database_(std::move(database)),
      stats_(stats),
      random_(random ? std::move(random) : std::make_unique<foundation::Mt19937RandomSource>()),
      pipeline_(database_, *random_, settings, &stats_) {}

// ── Combatants ──────────────────────────────────────────────────────────

ElementalCombatant& ElementalWorld::RegisterCombatant(EntityId id) {
    auto [it, inserted] = combatants_.try_emplace(id);
    if (!inserted) {
        ELEMCORE_LOG_WARN(LogCategory::World,
                          "Combatant " + std::to_string(id.value()) + " re-registered, replacing");
    }
    it->second = std::make_unique<ElementalCombatant>(id);

    if (currentEnvironment_) {
        applyEnvironmentModifiers(*it->second, *currentEnvironment_);
    }

    ELEMCORE_LOG_INFO(LogCategory::World, "Registered combatant " + std::to_string(id.value()));
    onCombatantRegistered.emit(id);
    return *it->second;
}

bool ElementalWorld::UnregisterCombatant(EntityId id) {
    if (combatants_.erase(id) == 0) {
        return false;
    }
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [id](const PendingResolution& p) { return p.target == id; }),
                   pending_.end());
    ELEMCORE_LOG_INFO(LogCategory::World, "Unregistered combatant " + std::to_string(id.value()));
    onCombatantUnregistered.emit(id);
    return true;
}

ElementalCombatant* ElementalWorld::GetCombatant(EntityId id) {
    auto it = combatants_.find(id);
    return it != combatants_.end() ? it->second.get() : nullptr;
}

const ElementalCombatant* ElementalWorld::GetCombatant(EntityId id) const {
    auto it = combatants_.find(id);
    return it != combatants_.end() ? it->second.get() : nullptr;
}

std::vector<ElementalCombatant*> ElementalWorld::GetCombatantsByElement(ElementType element) {
    std::vector<ElementalCombatant*> result;
    for (auto& [id, combatant] : combatants_) {
        if (combatant->PrimaryElement() == element || combatant->SecondaryElement() == element) {
            result.push_back(combatant.get());
        }
    }
    std::sort(result.begin(), result.end(),
              [](const ElementalCombatant* a, const ElementalCombatant* b) { return a->Id() < b->Id(); });
    return result;
}

// ── Environment ─────────────────────────────────────────────────────────

void ElementalWorld::RegisterEnvironment(EnvironmentProfile environment) {
    database_.AddEnvironment(std::move(environment));
}

EngineResult<void> ElementalWorld::SetEnvironment(std::string_view environmentId) {
    const auto* profile = database_.GetEnvironment(environmentId);
    if (profile == nullptr) {
        ELEMCORE_LOG_WARN(LogCategory::World,
                          "Environment not found: " + std::string(environmentId));
        return EngineResult<void>::err(
            EngineError(ErrorCode::EnvironmentNotFound,
                        "environment not found: " + std::string(environmentId)));
    }
    activateEnvironment(*profile);
    return EngineResult<void>::ok();
}

void ElementalWorld::SetEnvironment(EnvironmentProfile environment) {
    activateEnvironment(std::move(environment));
}

void ElementalWorld::ClearEnvironment() {
    activateEnvironment(std::nullopt);
}

void ElementalWorld::applyEnvironmentModifiers(ElementalCombatant& combatant,
                                               const EnvironmentProfile& environment) {
    for (auto modifier : environment.modifiers) {
        modifier.sourceId = environment.id;
        auto result = combatant.Modifiers().Apply(std::move(modifier));
        if (result.hasError()) {
            ELEMCORE_LOG_WARN(LogCategory::World,
                              "Environment " + environment.id + " modifier rejected: " +
                                  std::string(result.error().message()));
        }
    }
}

void ElementalWorld::activateEnvironment(std::optional<EnvironmentProfile> environment) {
    if (currentEnvironment_) {
        for (auto& [id, combatant] : combatants_) {
            combatant->Modifiers().RemoveBySource(currentEnvironment_->id);
        }
    }

    currentEnvironment_ = std::move(environment);

    if (currentEnvironment_) {
        for (auto& [id, combatant] : combatants_) {
            applyEnvironmentModifiers(*combatant, *currentEnvironment_);
        }
        ELEMCORE_LOG_INFO(LogCategory::World, "Environment changed to " + currentEnvironment_->name);
    } else {
        ELEMCORE_LOG_INFO(LogCategory::World, "Environment cleared");
    }
    onEnvironmentChanged.emit(CurrentEnvironment());
}

// ── Damage ──────────────────────────────────────────────────────────────

void ElementalWorld::SetGlobalDamageMultiplier(float multiplier) {
    auto settings = pipeline_.Settings();
    settings.globalDamageMultiplier = std::max(multiplier, 0.0f);
    pipeline_.SetSettings(settings);
    ELEMCORE_LOG_INFO(LogCategory::World,
                      "Global damage multiplier set to " + std::to_string(settings.globalDamageMultiplier));
}

EngineResult<DamageResult> ElementalWorld::CalculateElementalDamage(const ElementalAttack& attack,
                                                                    EntityId target) const {
    const auto* combatant = GetCombatant(target);
    if (combatant == nullptr) {
        return EngineResult<DamageResult>::err(combatantNotFound(target));
    }
    const auto& defense = combatant->GetElementalDefense();
    return EngineResult<DamageResult>::ok(
        pipeline_.Resolve(attack, &defense, &combatant->Overrides(), CurrentEnvironment()));
}

EngineResult<DamageResult> ElementalWorld::ApplyElementalDamage(const ElementalAttack& attack,
                                                                EntityId target) {
    auto* combatant = GetCombatant(target);
    if (combatant == nullptr) {
        ELEMCORE_LOG_WARN(LogCategory::World,
                          "Damage against unregistered combatant " + std::to_string(target.value()));
        return EngineResult<DamageResult>::err(combatantNotFound(target));
    }

    auto result = combatant->TakeElementalDamage(pipeline_, attack, stats_, applicator_,
                                                 CurrentEnvironment());
    ELEMCORE_LOG_DEBUG(LogCategory::World,
                       "Entity " + std::to_string(target.value()) + " took " +
                           std::to_string(result.finalDamage) + " elemental damage");

    onDamageCalculated.emit(target, result);
    if (pipeline_.Settings().enableEnvironmentalEffects && currentEnvironment_) {
        processAmbientReactions(result, target);
    }
    return EngineResult<DamageResult>::ok(std::move(result));
}

void ElementalWorld::processAmbientReactions(const DamageResult& result, EntityId target) {
    if (result.resolvedParts.empty()) {
        return;
    }
    for (const auto& ambient : currentEnvironment_->ambientEffects) {
        if (random_->NextUnit() >= ambient.applicationChance) {
            continue;
        }
        bool blocked = std::any_of(result.resolvedParts.begin(), result.resolvedParts.end(),
                                   [&ambient](const ElementalPower& part) {
                                       return std::find(ambient.immuneElements.begin(),
                                                        ambient.immuneElements.end(),
                                                        part.element) != ambient.immuneElements.end();
                                   });
        if (blocked || applicator_ == nullptr) {
            continue;
        }
        if (applicator_->TryApplyEffect(ambient.statusEffectId, result.resolvedParts.front().element,
                                        target)) {
            ELEMCORE_LOG_DEBUG(LogCategory::World,
                               "Ambient effect " + ambient.statusEffectId + " applied to " +
                                   std::to_string(target.value()));
        }
    }
}

void ElementalWorld::QueueResolution(ElementalAttack attack, EntityId target,
                                     ResolutionCallback callback) {
    pending_.push_back({std::move(attack), target, std::move(callback)});
}

std::size_t ElementalWorld::ProcessPending() {
    auto budget = static_cast<std::size_t>(std::max(pipeline_.Settings().maxCalculationsPerTick, 0));
    std::size_t processed = 0;

    while (!pending_.empty() && processed < budget) {
        auto next = std::move(pending_.front());
        pending_.pop_front();
        ++processed;

        auto result = ApplyElementalDamage(next.attack, next.target);
        if (result.hasError()) {
            continue;
        }
        if (next.callback) {
            next.callback(result.value());
        }
    }

    if (!pending_.empty()) {
        ELEMCORE_LOG_DEBUG(LogCategory::World,
                           "Resolution budget reached, " + std::to_string(pending_.size()) +
                               " deferred");
    }
    return processed;
}

// ── Modifiers ───────────────────────────────────────────────────────────

void ElementalWorld::ApplyModifierToAll(const Modifier& modifier) {
    for (auto& [id, combatant] : combatants_) {
        auto copy = modifier;
        copy.id = modifier.id + "_" + std::to_string(id.value());
        auto result = combatant->Modifiers().Apply(std::move(copy));
        if (result.hasError()) {
            ELEMCORE_LOG_WARN(LogCategory::World,
                              "Modifier " + modifier.id + " rejected: " +
                                  std::string(result.error().message()));
            return;
        }
    }
}

std::size_t ElementalWorld::RemoveModifiersBySource(std::string_view sourceId) {
    std::size_t count = 0;
    for (auto& [id, combatant] : combatants_) {
        count += combatant->Modifiers().RemoveBySource(sourceId);
    }
    return count;
}

void ElementalWorld::Tick(float deltaTime) {
    for (auto& [id, combatant] : combatants_) {
        combatant->Tick(deltaTime);
    }
    ProcessPending();
}

}  // namespace elemcore::combat
