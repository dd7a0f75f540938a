/// @file attack.cpp
/// @brief ElementalAttack implementation.

#include "elemcore/combat/attack.hpp"

#include <algorithm>

namespace elemcore::combat {

ElementalAttack::ElementalAttack(ElementType element, float power,
                                 std::optional<foundation::EntityId> source)
    : parts_{{element, power}}, source_(source) {}

ElementalAttack::ElementalAttack(std::vector<ElementalPower> parts,
                                 std::optional<foundation::EntityId> source)
    : parts_(std::move(parts)), source_(source) {}

void ElementalAttack::AddElement(ElementType element, float power) {
    parts_.push_back({element, power});
}

std::vector<ElementalPower> ElementalAttack::EffectiveParts() const {
    if (composite_) {
        return {{composite_->element, composite_->power}};
    }
    return parts_;
}

void ElementalAttack::SetComposite(ElementType element, float power) {
    composite_ = CompositeState{element, power};
}

float ElementalAttack::GetTotalPower() const {
    if (composite_) {
        return composite_->power;
    }
    float total = 0.0f;
    for (const auto& part : parts_) {
        total += part.power;
    }
    return total;
}

float ElementalAttack::GetElementPower(ElementType element) const {
    if (composite_) {
        return composite_->element == element ? composite_->power : 0.0f;
    }
    float total = 0.0f;
    for (const auto& part : parts_) {
        if (part.element == element) {
            total += part.power;
        }
    }
    return total;
}

bool ElementalAttack::HasElement(ElementType element) const {
    if (composite_) {
        return composite_->element == element;
    }
    return std::any_of(parts_.begin(), parts_.end(),
                       [element](const ElementalPower& p) { return p.element == element; });
}

std::vector<ElementType> ElementalAttack::GetUniqueElements() const {
    if (composite_) {
        return {composite_->element};
    }
    std::vector<ElementType> unique;
    for (const auto& part : parts_) {
        if (std::find(unique.begin(), unique.end(), part.element) == unique.end()) {
            unique.push_back(part.element);
        }
    }
    return unique;
}

ElementalAttack ElementalAttack::WithMultiplier(float multiplier) const {
    ElementalAttack scaled = *this;
    if (scaled.composite_) {
        scaled.composite_->power *= multiplier;
    } else {
        for (auto& part : scaled.parts_) {
            part.power *= multiplier;
        }
    }
    return scaled;
}

}  // namespace elemcore::combat
