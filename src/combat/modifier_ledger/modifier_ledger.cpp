/// @file modifier_ledger.cpp
/// @brief ModifierLedger implementation.

#include "elemcore/combat/modifier_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

float stackFactor(const Modifier& modifier) {
    return static_cast<float>(std::max(modifier.currentStacks, 1));
}

}  // namespace

std::string affinityOverrideKey(std::string_view modifierId, ElementType attack, ElementType defense) {
    std::string key(modifierId);
    key += '_';
    key += elementName(attack);
    key += '_';
    key += elementName(defense);
    return key;
}

ModifierLedger::ModifierLedger(AttackBuilder& builder, ResistanceAggregator& aggregator,
                               AffinityOverrideTable& overrides,
                               std::optional<foundation::EntityId> owner)
    : builder_(builder), aggregator_(aggregator), overrides_(overrides), owner_(owner) {}

void ModifierLedger::logModifier(std::string_view message, const Modifier& modifier) const {
    auto& logger = foundation::EngineLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Modifier)) {
        return;
    }
    foundation::LogContext ctx;
    ctx.entityId = owner_;
    ctx.modifierId = modifier.id;
    if (!modifier.sourceId.empty()) {
        ctx.sourceId = modifier.sourceId;
    }
    ctx.extra["kind"] = std::string(modifierKindName(modifier.Kind()));
    ctx.extra["stacks"] = std::to_string(modifier.currentStacks);
    logger.logWithContext(LogLevel::Debug, LogCategory::Modifier, message, ctx);
}

// ── Dispatch ────────────────────────────────────────────────────────────

void ModifierLedger::dispatch(const Modifier& modifier) {
    float stacks = stackFactor(modifier);
    std::optional<float> duration;
    if (!modifier.isPermanent) {
        duration = modifier.remainingDuration;
    }

    std::visit(
        [&](const auto& effect) {
            using T = std::decay_t<decltype(effect)>;
            if constexpr (std::is_same_v<T, AttackBonusEffect>) {
                for (const auto& bonus : effect.bonuses) {
                    builder_.RegisterSkillBonus(modifier.id, bonus.element, bonus.flatValue * stacks,
                                                bonus.percentageValue * stacks, duration, modifier.id);
                }
            } else if constexpr (std::is_same_v<T, DefenseResistanceEffect>) {
                ResistanceProfile profile;
                for (const auto& value : effect.resistances) {
                    profile.SetResistance(value.element,
                                          profile.GetResistance(value.element) + value.flatValue * stacks);
                }
                aggregator_.AddTemporary(modifier.id, std::move(profile));
            } else if constexpr (std::is_same_v<T, AffinityOverrideEffect>) {
                for (const auto& entry : effect.overrides) {
                    overrides_.AddOverride(
                        affinityOverrideKey(modifier.id, entry.attackElement, entry.defenseElement),
                        entry.attackElement, entry.defenseElement, entry.newAffinity, duration,
                        modifier.sourceId);
                }
            }
            // Conversion and composite bonuses are read at build time.
        },
        modifier.effect);
}

void ModifierLedger::revert(const Modifier& modifier) {
    std::visit(
        [&](const auto& effect) {
            using T = std::decay_t<decltype(effect)>;
            if constexpr (std::is_same_v<T, AttackBonusEffect>) {
                builder_.RemoveSkillBonusesFrom(modifier.id, modifier.id);
            } else if constexpr (std::is_same_v<T, DefenseResistanceEffect>) {
                aggregator_.RemoveTemporary(modifier.id);
            } else if constexpr (std::is_same_v<T, AffinityOverrideEffect>) {
                for (const auto& entry : effect.overrides) {
                    overrides_.RemoveOverride(
                        affinityOverrideKey(modifier.id, entry.attackElement, entry.defenseElement));
                }
            }
        },
        modifier.effect);
}

std::optional<Modifier> ModifierLedger::detach(std::string_view modifierId) {
    auto it = std::find_if(active_.begin(), active_.end(),
                           [modifierId](const Modifier& m) { return m.id == modifierId; });
    if (it == active_.end()) {
        return std::nullopt;
    }
    Modifier modifier = std::move(*it);
    active_.erase(it);
    revert(modifier);
    ++version_;
    return modifier;
}

// ── Lifecycle ───────────────────────────────────────────────────────────

EngineResult<void> ModifierLedger::Apply(Modifier modifier) {
    if (modifier.id.empty()) {
        ELEMCORE_LOG_WARN(LogCategory::Modifier, "Rejected modifier with empty id");
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidModifier, "modifier id is empty"));
    }
    if (modifier.maxStacks < 1) {
        ELEMCORE_LOG_WARN(LogCategory::Modifier,
                          "Rejected modifier '" + modifier.id + "': maxStacks must be at least 1");
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidModifier,
                        "modifier maxStacks must be at least 1", modifier.id));
    }
    modifier.currentStacks = std::clamp(modifier.currentStacks, 1, modifier.maxStacks);

    if (auto previous = detach(modifier.id)) {
        if (modifier.allowStacking) {
            modifier.currentStacks = std::min(previous->currentStacks + 1, modifier.maxStacks);
        }
        onRemoved.emit(*previous);
    }

    dispatch(modifier);
    active_.push_back(std::move(modifier));
    ++version_;

    const auto& applied = active_.back();
    logModifier("Modifier applied", applied);
    onApplied.emit(applied);
    return EngineResult<void>::ok();
}

bool ModifierLedger::Remove(std::string_view modifierId) {
    auto removed = detach(modifierId);
    if (!removed) {
        return false;
    }
    logModifier("Modifier removed", *removed);
    onRemoved.emit(*removed);
    return true;
}

std::size_t ModifierLedger::RemoveBySource(std::string_view sourceId) {
    std::vector<std::string> ids;
    for (const auto& modifier : active_) {
        if (modifier.sourceId == sourceId) {
            ids.push_back(modifier.id);
        }
    }
    std::size_t count = 0;
    for (const auto& id : ids) {
        if (Remove(id)) {
            ++count;
        }
    }
    return count;
}

void ModifierLedger::Tick(float deltaTime) {
    std::vector<std::string> expired;
    for (auto& modifier : active_) {
        if (modifier.isPermanent) {
            continue;
        }
        modifier.remainingDuration -= deltaTime;
        if (modifier.remainingDuration <= 0.0f) {
            expired.push_back(modifier.id);
        }
    }

    for (const auto& id : expired) {
        if (auto modifier = detach(id)) {
            logModifier("Modifier expired", *modifier);
            onExpired.emit(*modifier);
        }
    }

    builder_.Tick(deltaTime);
    overrides_.Tick(deltaTime);
}

// ── Queries ─────────────────────────────────────────────────────────────

std::vector<Modifier> ModifierLedger::GetModifiersBySource(std::string_view sourceId) const {
    std::vector<Modifier> result;
    for (const auto& modifier : active_) {
        if (modifier.sourceId == sourceId) {
            result.push_back(modifier);
        }
    }
    return result;
}

bool ModifierLedger::HasModifier(std::string_view modifierId) const {
    return GetModifier(modifierId) != nullptr;
}

const Modifier* ModifierLedger::GetModifier(std::string_view modifierId) const {
    auto it = std::find_if(active_.begin(), active_.end(),
                           [modifierId](const Modifier& m) { return m.id == modifierId; });
    return it != active_.end() ? &*it : nullptr;
}

void ModifierLedger::ClearAll() {
    while (!active_.empty()) {
        Remove(std::string(active_.front().id));
    }
}

std::size_t ModifierLedger::ClearByKind(ModifierKind kind) {
    std::vector<std::string> ids;
    for (const auto& modifier : active_) {
        if (modifier.Kind() == kind) {
            ids.push_back(modifier.id);
        }
    }
    std::size_t count = 0;
    for (const auto& id : ids) {
        if (Remove(id)) {
            ++count;
        }
    }
    return count;
}

// ── Bulk registration ───────────────────────────────────────────────────

EngineResult<void> ModifierLedger::applyAll(std::string_view sourceId, std::vector<Modifier> modifiers,
                                            std::optional<float> duration) {
    std::optional<EngineError> firstError;
    for (auto& modifier : modifiers) {
        modifier.sourceId = std::string(sourceId);
        if (duration) {
            modifier.isPermanent = false;
            modifier.remainingDuration = *duration;
            modifier.originalDuration = *duration;
        } else {
            modifier.isPermanent = true;
        }
        auto result = Apply(std::move(modifier));
        if (result.hasError() && !firstError) {
            firstError = result.error();
        }
    }
    if (firstError) {
        return EngineResult<void>::err(std::move(*firstError));
    }
    return EngineResult<void>::ok();
}

EngineResult<void> ModifierLedger::RegisterEquipmentModifiers(std::string_view equipmentId,
                                                              std::vector<Modifier> modifiers) {
    return applyAll(equipmentId, std::move(modifiers), std::nullopt);
}

EngineResult<void> ModifierLedger::RegisterBuffModifiers(std::string_view buffId,
                                                         std::vector<Modifier> modifiers,
                                                         float duration) {
    return applyAll(buffId, std::move(modifiers), duration);
}

EngineResult<void> ModifierLedger::RegisterSkillModifiers(std::string_view skillId,
                                                          std::vector<Modifier> modifiers,
                                                          float duration) {
    std::optional<float> timed;
    if (duration >= 0.0f) {
        timed = duration;
    }
    return applyAll(skillId, std::move(modifiers), timed);
}

// ── Build-time effects ──────────────────────────────────────────────────

std::vector<ElementalConversionRule> ModifierLedger::GetConversionRules() const {
    std::vector<ElementalConversionRule> rules;
    for (const auto& modifier : active_) {
        if (const auto* conversion = std::get_if<ElementalConversionEffect>(&modifier.effect)) {
            rules.push_back(conversion->rule);
        }
    }
    return rules;
}

float ModifierLedger::GetCompositeBonusMultiplier() const {
    float multiplier = 1.0f;
    for (const auto& modifier : active_) {
        if (const auto* bonus = std::get_if<CompositeBonusEffect>(&modifier.effect)) {
            multiplier *= std::pow(bonus->multiplier, stackFactor(modifier));
        }
    }
    return multiplier;
}

}  // namespace elemcore::combat
