/// @file resolution_pipeline.cpp
/// @brief ResolutionPipeline implementation.
///
/// Per-pair damage:
///   damage = power * affinity * (1 - resistance)
///   environment: damage = (damage * envMultiplier + envBonus) * (1 - envResistance)
///   damage = max(damage, 0); immune -> 0

#include "elemcore/combat/resolution_pipeline.hpp"

#include <algorithm>
#include <string>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::LogCategory;

namespace {

constexpr std::string_view kStepBase = "Base";
constexpr std::string_view kStepComposition = "Composition";
constexpr std::string_view kStepDefense = "Defense";
constexpr std::string_view kStepElement = "Element";
constexpr std::string_view kStepPost = "Post";
constexpr std::string_view kStepEffects = "Effects";

std::string formatPower(float value) {
    auto text = std::to_string(value);
    // Trim trailing zeros for readability ("25.000000" -> "25").
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

std::string_view statName(StatKind kind) {
    switch (kind) {
        case StatKind::Offense:        return "Offense";
        case StatKind::MagicPower:     return "MagicPower";
        case StatKind::CriticalRate:   return "CriticalRate";
        case StatKind::CriticalDamage: return "CriticalDamage";
    }
    return "Unknown";
}

}  // namespace

ResolutionPipeline::ResolutionPipeline(const ElementDatabase& database,
                                       foundation::IRandomSource& random,
                                       EngineSettings settings, const IStatAccessor* stats)
    : database_(database), random_(random), settings_(settings), stats_(stats) {}

ResistanceProfile ResolutionPipeline::MergeDefense(const ResistanceProfile& base,
                                                   const ResistanceProfile& aggregated) {
    ResistanceProfile merged = base;
    for (const auto& [element, value] : aggregated.resistances) {
        merged.SetResistance(element, merged.GetResistance(element) + value);
    }
    for (auto element : aggregated.immunities) {
        merged.AddImmunity(element);
    }
    for (auto element : aggregated.weaknesses) {
        merged.AddWeakness(element);
    }
    if (merged.primaryElement == ElementType::None) {
        merged.primaryElement = aggregated.primaryElement;
    }
    return merged;
}

// ── Steps ───────────────────────────────────────────────────────────────

float ResolutionPipeline::attackerStat(const ElementalAttack& attack, StatKind kind,
                                       DamageResult& result) const {
    std::optional<float> value;
    if (stats_ != nullptr && attack.Source()) {
        value = stats_->GetStat(*attack.Source(), kind);
    }
    if (!value) {
        float neutral = neutralStat(kind);
        ELEMCORE_LOG_DEBUG(LogCategory::Resolution,
                           "Attacker stat " + std::string(statName(kind)) +
                               " unavailable, using " + formatPower(neutral));
        result.AddCalculationLog(kStepPost, "missing " + std::string(statName(kind)) +
                                                ", using neutral " + formatPower(neutral));
        return neutral;
    }
    return *value;
}

float ResolutionPipeline::baseDamage(const ElementalAttack& attack, DamageResult& result) const {
    if (attack.Source() && stats_ != nullptr) {
        auto offense = stats_->GetStat(*attack.Source(), StatKind::Offense);
        float value = offense.value_or(neutralStat(StatKind::Offense));
        if (!offense) {
            ELEMCORE_LOG_DEBUG(LogCategory::Resolution, "Attacker Offense unavailable, using 0");
            result.AddCalculationLog(kStepBase, "missing Offense, using neutral 0");
        }
        result.AddCalculationLog(kStepBase, "attacker offense " + formatPower(value));
        return value;
    }
    float total = attack.GetTotalPower();
    result.AddCalculationLog(kStepBase, "raw total power " + formatPower(total));
    return total;
}

ElementalAttack ResolutionPipeline::compose(const ElementalAttack& attack, DamageResult& result) const {
    if (attack.IsComposite()) {
        result.AddCalculationLog(kStepComposition, "attack already composite");
        return attack;
    }
    if (!settings_.enableComposition || !attack.AllowsComposition() || attack.GetElementCount() <= 1) {
        return attack;
    }

    auto combination = database_.Composition().TryCombine(attack.RawParts());
    if (!combination.isComposite) {
        result.AddCalculationLog(kStepComposition, "no composite rule matched");
        return attack;
    }

    float power = combination.power * attack.CompositeMultiplier();
    ElementalAttack composed = attack;
    composed.SetComposite(combination.element, power);
    result.AddCalculationLog(kStepComposition,
                             "rule '" + combination.ruleName + "' -> " +
                                 std::string(elementName(combination.element)) + " " +
                                 formatPower(power));
    return composed;
}

float ResolutionPipeline::elementDamage(ElementType element, float power,
                                        const ResistanceProfile& defense,
                                        const AffinityOverrideTable* overrides,
                                        const EnvironmentProfile* environment,
                                        DamageResult& result) const {
    float affinity = database_.Affinities().Get(element, defense.primaryElement);
    if (overrides != nullptr) {
        affinity = overrides->GetModifiedAffinity(element, defense.primaryElement, affinity);
    }

    float damage = power * affinity;
    damage *= 1.0f - defense.GetResistance(element);
    if (defense.IsImmune(element)) {
        damage = 0.0f;
    }

    // Environment terms follow immunity; a power bonus still lands.
    if (environment != nullptr && settings_.enableEnvironmentalEffects) {
        damage *= environment->GetDamageMultiplier(element);
        damage += environment->GetPowerBonus(element);
        damage *= 1.0f - environment->GetResistance(element);
    }

    damage = std::max(damage, 0.0f);

    result.AddCalculationLog(kStepElement,
                             std::string(elementName(element)) + " power " + formatPower(power) +
                                 " x affinity " + formatPower(affinity) + " x resistance " +
                                 formatPower(defense.GetResistance(element)) + " = " +
                                 formatPower(damage) +
                                 (defense.IsImmune(element) ? " (immune)" : ""));
    return damage;
}

float ResolutionPipeline::postModifiers(float damage, const ElementalAttack& attack,
                                        foundation::IRandomSource& random, DamageResult& result) const {
    if (attack.Source()) {
        float critRate = attackerStat(attack, StatKind::CriticalRate, result);
        if (critRate > 0.0f && random.NextUnit() < critRate) {
            float critDamage = attackerStat(attack, StatKind::CriticalDamage, result);
            damage *= critDamage;
            result.isCritical = true;
            result.AddCalculationLog(kStepPost, "critical x" + formatPower(critDamage));
        }
    }

    result.varianceMultiplier = random.Range(settings_.varianceMin, settings_.varianceMax);
    damage *= result.varianceMultiplier;
    result.AddCalculationLog(kStepPost, "variance x" + formatPower(result.varianceMultiplier));

    if (settings_.globalDamageMultiplier != 1.0f) {
        damage *= std::max(settings_.globalDamageMultiplier, 0.0f);
        result.AddCalculationLog(kStepPost,
                                 "global multiplier x" + formatPower(settings_.globalDamageMultiplier));
    }
    return damage;
}

void ResolutionPipeline::collectEffects(DamageResult& result) const {
    std::vector<ElementType> seen;
    for (const auto& part : result.resolvedParts) {
        if (std::find(seen.begin(), seen.end(), part.element) != seen.end()) {
            continue;
        }
        seen.push_back(part.element);

        const auto* definition = database_.GetDefinition(part.element);
        if (definition == nullptr) {
            continue;
        }
        for (const auto& effect : definition->effects) {
            if (!effect.ShouldApply(result.finalDamage, part.element)) {
                continue;
            }
            result.triggeredEffects.push_back(
                {effect.effectId, part.element, effect.statusEffectIds, effect.basePower, effect.duration});
            result.AddCalculationLog(kStepEffects, "eligible " + effect.effectId);
        }
    }
}

// ── Resolve ─────────────────────────────────────────────────────────────

DamageResult ResolutionPipeline::Resolve(const ElementalAttack& attack,
                                         const ResistanceProfile* defense,
                                         const AffinityOverrideTable* overrides,
                                         const EnvironmentProfile* environment) const {
    return Resolve(attack, defense, overrides, environment, random_);
}

DamageResult ResolutionPipeline::Resolve(const ElementalAttack& attack,
                                         const ResistanceProfile* defense,
                                         const AffinityOverrideTable* overrides,
                                         const EnvironmentProfile* environment,
                                         foundation::IRandomSource& random) const {
    DamageResult result;

    result.baseDamage = baseDamage(attack, result);

    auto resolved = compose(attack, result);
    result.resolvedParts = resolved.EffectiveParts();
    result.isComposite = resolved.IsComposite();
    if (resolved.Composite()) {
        result.compositeElement = resolved.Composite()->element;
    }

    if (defense != nullptr) {
        result.defenseResistances = *defense;
    } else {
        result.AddCalculationLog(kStepDefense, "no defense profile, zero resistance");
    }

    float total = 0.0f;
    for (const auto& part : result.resolvedParts) {
        float damage = elementDamage(part.element, part.power, result.defenseResistances, overrides,
                                     environment, result);
        result.AccumulateElementDamage(part.element, damage);
        total += damage;
    }

    result.finalDamage = postModifiers(total, attack, random, result);
    collectEffects(result);

    ELEMCORE_LOG_DEBUG(LogCategory::Resolution,
                       "Resolved " + std::to_string(result.resolvedParts.size()) +
                           " part(s) for " + formatPower(result.finalDamage) + " damage");
    return result;
}

}  // namespace elemcore::combat
