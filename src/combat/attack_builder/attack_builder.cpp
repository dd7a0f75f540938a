/// @file attack_builder.cpp
/// @brief AttackBuilder implementation.

#include "elemcore/combat/attack_builder.hpp"

#include <algorithm>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::LogCategory;

namespace {

const std::vector<ElementalBonus>* findBucket(const AttackBuilder::BonusTable& table,
                                              std::string_view id) {
    auto it = std::find_if(table.begin(), table.end(),
                           [id](const auto& entry) { return entry.first == id; });
    return it != table.end() ? &it->second : nullptr;
}

float statOrNeutral(const IStatAccessor& stats, foundation::EntityId entity, StatKind kind) {
    return stats.GetStat(entity, kind).value_or(neutralStat(kind));
}

void appendBonuses(ElementalAttack& attack, const std::vector<ElementalBonus>& bonuses,
                   float scalingStat) {
    for (const auto& bonus : bonuses) {
        float power = bonus.flatBonus;
        if (bonus.percentageBonus > 0.0f) {
            power += scalingStat * bonus.percentageBonus;
        }
        if (power > 0.0f) {
            attack.AddElement(bonus.element, power);
        }
    }
}

}  // namespace

void AttackBuilder::addBonus(BonusTable& table, std::string id, ElementalBonus bonus) {
    auto it = std::find_if(table.begin(), table.end(),
                           [&id](const auto& entry) { return entry.first == id; });
    if (it == table.end()) {
        table.emplace_back(std::move(id), std::vector<ElementalBonus>{bonus});
    } else {
        it->second.push_back(bonus);
    }
    ++version_;
}

void AttackBuilder::RegisterWeaponBonus(std::string weaponId, ElementType element, float flatBonus,
                                        float percentageBonus) {
    addBonus(weaponBonuses_, std::move(weaponId),
             ElementalBonus{element, flatBonus, percentageBonus, std::nullopt});
}

void AttackBuilder::RegisterSkillBonus(std::string skillId, ElementType element, float flatBonus,
                                       float percentageBonus, std::optional<float> duration,
                                       std::string ownerId) {
    addBonus(skillBonuses_, std::move(skillId),
             ElementalBonus{element, flatBonus, percentageBonus, duration, std::move(ownerId)});
}

bool AttackBuilder::RemoveWeaponBonuses(std::string_view weaponId) {
    auto removed = std::erase_if(weaponBonuses_,
                                 [weaponId](const auto& entry) { return entry.first == weaponId; });
    if (removed == 0) {
        return false;
    }
    ++version_;
    return true;
}

bool AttackBuilder::RemoveSkillBonuses(std::string_view skillId) {
    auto removed = std::erase_if(skillBonuses_,
                                 [skillId](const auto& entry) { return entry.first == skillId; });
    if (removed == 0) {
        return false;
    }
    ++version_;
    return true;
}

bool AttackBuilder::RemoveSkillBonusesFrom(std::string_view skillId, std::string_view ownerId) {
    auto it = std::find_if(skillBonuses_.begin(), skillBonuses_.end(),
                           [skillId](const auto& entry) { return entry.first == skillId; });
    if (it == skillBonuses_.end()) {
        return false;
    }
    auto removed = std::erase_if(it->second,
                                 [ownerId](const ElementalBonus& b) { return b.ownerId == ownerId; });
    if (removed == 0) {
        return false;
    }
    if (it->second.empty()) {
        skillBonuses_.erase(it);
    }
    ++version_;
    return true;
}

ElementalAttack AttackBuilder::Build(foundation::EntityId attacker, const IStatAccessor& stats,
                                     std::optional<std::string_view> weaponId,
                                     std::optional<std::string_view> skillId) const {
    ElementalAttack attack;
    attack.SetSource(attacker);

    float offense = statOrNeutral(stats, attacker, StatKind::Offense);

    if (weaponId) {
        if (const auto* bonuses = findBucket(weaponBonuses_, *weaponId)) {
            appendBonuses(attack, *bonuses, offense);
        }
    }
    if (skillId) {
        if (const auto* bonuses = findBucket(skillBonuses_, *skillId)) {
            appendBonuses(attack, *bonuses, statOrNeutral(stats, attacker, StatKind::MagicPower));
        }
    }

    if (attack.RawParts().empty()) {
        attack.AddElement(ElementType::None, offense);
    }

    ELEMCORE_LOG_DEBUG(LogCategory::Attack,
                       "Built attack with " + std::to_string(attack.RawParts().size()) +
                           " part(s), total power " + std::to_string(attack.GetTotalPower()));
    return attack;
}

bool AttackBuilder::tickTable(BonusTable& table, float deltaTime) {
    bool changed = false;
    for (auto& [id, bonuses] : table) {
        for (auto& bonus : bonuses) {
            if (bonus.remainingDuration) {
                *bonus.remainingDuration -= deltaTime;
            }
        }
        auto expired = std::erase_if(bonuses, [](const ElementalBonus& b) {
            return b.remainingDuration && *b.remainingDuration <= 0.0f;
        });
        changed = changed || expired > 0;
    }
    auto emptied = std::erase_if(table, [](const auto& entry) { return entry.second.empty(); });
    return changed || emptied > 0;
}

void AttackBuilder::Tick(float deltaTime) {
    bool weaponChanged = tickTable(weaponBonuses_, deltaTime);
    bool skillChanged = tickTable(skillBonuses_, deltaTime);
    if (weaponChanged || skillChanged) {
        ++version_;
    }
}

bool AttackBuilder::clearTemporary(BonusTable& table) {
    bool changed = false;
    for (auto& [id, bonuses] : table) {
        changed = std::erase_if(bonuses, [](const ElementalBonus& b) { return b.IsTemporary(); }) > 0 ||
                  changed;
    }
    std::erase_if(table, [](const auto& entry) { return entry.second.empty(); });
    return changed;
}

void AttackBuilder::ClearTemporary() {
    bool weaponChanged = clearTemporary(weaponBonuses_);
    bool skillChanged = clearTemporary(skillBonuses_);
    if (weaponChanged || skillChanged) {
        ++version_;
    }
}

std::vector<ElementalBonus> AttackBuilder::GetWeaponBonuses(std::string_view weaponId) const {
    const auto* bonuses = findBucket(weaponBonuses_, weaponId);
    return bonuses ? *bonuses : std::vector<ElementalBonus>{};
}

std::vector<ElementalBonus> AttackBuilder::GetSkillBonuses(std::string_view skillId) const {
    const auto* bonuses = findBucket(skillBonuses_, skillId);
    return bonuses ? *bonuses : std::vector<ElementalBonus>{};
}

ElementalAttack AttackBuilder::ApplyConversions(const ElementalAttack& attack,
                                                const std::vector<ElementalConversionRule>& rules) {
    std::vector<ElementalPower> parts = attack.RawParts();

    for (const auto& rule : rules) {
        float ratio = rule.conversionPercentage / 100.0f;
        std::vector<ElementalPower> appended;
        for (auto& part : parts) {
            if (part.element != rule.sourceElement) {
                continue;
            }
            float converted = part.power * ratio;
            if (rule.additive) {
                appended.push_back({rule.targetElement, converted});
            } else {
                part = {rule.targetElement, converted};
            }
        }
        parts.insert(parts.end(), appended.begin(), appended.end());
    }

    ElementalAttack result(std::move(parts), attack.Source());
    result.SetAllowComposition(attack.AllowsComposition());
    result.SetCompositeMultiplier(attack.CompositeMultiplier());
    return result;
}

}  // namespace elemcore::combat
