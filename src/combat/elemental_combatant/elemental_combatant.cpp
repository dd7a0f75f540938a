/// @file elemental_combatant.cpp
/// @brief ElementalCombatant implementation.

#include "elemcore/combat/elemental_combatant.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::LogCategory;

ElementalCombatant::ElementalCombatant(foundation::EntityId id)
    : id_(id), ledger_(builder_, aggregator_, overrides_, id) {}

// ── Base profile ────────────────────────────────────────────────────────

void ElementalCombatant::SetBaseResistance(ElementType element, float value) {
    base_.SetResistance(element, value);
    ++baseVersion_;
}

void ElementalCombatant::RemoveBaseResistance(ElementType element) {
    base_.RemoveResistance(element);
    ++baseVersion_;
}

bool ElementalCombatant::AddImmunity(ElementType element) {
    if (!base_.AddImmunity(element)) {
        return false;
    }
    ++baseVersion_;
    return true;
}

bool ElementalCombatant::RemoveImmunity(ElementType element) {
    if (!base_.RemoveImmunity(element)) {
        return false;
    }
    ++baseVersion_;
    return true;
}

bool ElementalCombatant::AddWeakness(ElementType element) {
    if (!base_.AddWeakness(element)) {
        return false;
    }
    ++baseVersion_;
    return true;
}

bool ElementalCombatant::RemoveWeakness(ElementType element) {
    if (!base_.RemoveWeakness(element)) {
        return false;
    }
    ++baseVersion_;
    return true;
}

void ElementalCombatant::SetPrimaryElement(ElementType element) {
    base_.primaryElement = element;
    ++baseVersion_;
}

// ── Combat ──────────────────────────────────────────────────────────────

const ResistanceProfile& ElementalCombatant::GetElementalDefense() const {
    auto key = currentKey();
    if (!cacheKey_ || !(*cacheKey_ == key)) {
        cachedDefense_ = ResolutionPipeline::MergeDefense(base_, aggregator_.CalculateTotal());
        cacheKey_ = key;
    }
    return cachedDefense_;
}

ElementalAttack ElementalCombatant::CreateElementalAttack(const IStatAccessor& stats,
                                                          std::optional<std::string_view> weaponId,
                                                          std::optional<std::string_view> skillId) const {
    auto attack = builder_.Build(id_, stats, weaponId, skillId);

    auto rules = ledger_.GetConversionRules();
    if (!rules.empty()) {
        attack = AttackBuilder::ApplyConversions(attack, rules);
    }
    attack.SetCompositeMultiplier(attack.CompositeMultiplier() * ledger_.GetCompositeBonusMultiplier());
    return attack;
}

DamageResult ElementalCombatant::TakeElementalDamage(const ResolutionPipeline& pipeline,
                                                     const ElementalAttack& attack,
                                                     IStatAccessor& stats,
                                                     IStatusEffectApplicator* applicator,
                                                     const EnvironmentProfile* environment) {
    const auto& defense = GetElementalDefense();
    auto result = pipeline.Resolve(attack, &defense, &overrides_, environment);

    if (result.finalDamage > 0.0f) {
        stats.ApplyDamage(id_, result.finalDamage);
    }

    if (applicator != nullptr) {
        auto offer = [&](std::string_view effectId, ElementType element) {
            if (!applicator->TryApplyEffect(effectId, element, id_)) {
                ELEMCORE_LOG_DEBUG(LogCategory::Resolution,
                                   "Status effect " + std::string(effectId) + " not applied");
            }
        };
        for (const auto& effect : result.triggeredEffects) {
            if (effect.statusEffectIds.empty()) {
                offer(effect.effectId, effect.element);
                continue;
            }
            for (const auto& statusId : effect.statusEffectIds) {
                offer(statusId, effect.element);
            }
        }
    }

    std::vector<ElementType> notified;
    for (const auto& part : result.resolvedParts) {
        if (!defense.IsImmune(part.element) ||
            std::find(notified.begin(), notified.end(), part.element) != notified.end()) {
            continue;
        }
        notified.push_back(part.element);
        ELEMCORE_LOG_DEBUG(LogCategory::Resolution,
                           "Entity " + std::to_string(id_.value()) + " immune to " +
                               std::string(elementName(part.element)));
        onImmunityTriggered.emit(part.element);
    }

    onDamageTaken.emit(result);
    return result;
}

}  // namespace elemcore::combat
