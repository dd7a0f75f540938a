/// @file damage_result.cpp
/// @brief DamageResult helpers.

#include "elemcore/combat/damage_result.hpp"

#include <algorithm>

namespace elemcore::combat {

float DamageResult::GetElementDamage(ElementType element) const {
    for (const auto& [e, damage] : breakdown) {
        if (e == element) {
            return damage;
        }
    }
    return 0.0f;
}

bool DamageResult::WasElementUsed(ElementType element) const {
    return std::any_of(resolvedParts.begin(), resolvedParts.end(),
                       [element](const ElementalPower& p) { return p.element == element; });
}

ElementType DamageResult::GetDominantElement() const {
    ElementType dominant = ElementType::None;
    float best = 0.0f;
    bool found = false;
    for (const auto& [element, damage] : breakdown) {
        if (!found || damage > best) {
            dominant = element;
            best = damage;
            found = true;
        }
    }
    return dominant;
}

void DamageResult::AccumulateElementDamage(ElementType element, float damage) {
    for (auto& [e, total] : breakdown) {
        if (e == element) {
            total += damage;
            return;
        }
    }
    breakdown.emplace_back(element, damage);
}

void DamageResult::AddCalculationLog(std::string_view step, std::string_view message) {
    std::string entry;
    entry.reserve(step.size() + message.size() + 3);
    entry += '[';
    entry += step;
    entry += "] ";
    entry += message;
    calculationLog.push_back(std::move(entry));
}

}  // namespace elemcore::combat
