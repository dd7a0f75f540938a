#pragma once

/// @file attack.hpp
/// @brief ElementalAttack: ordered element/power pairs with composite state.

#include <optional>
#include <vector>

#include "elemcore/combat/element_types.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::combat {

/// One typed power contribution of an attack.
struct ElementalPower {
    ElementType element = ElementType::None;
    float power = 0.0f;

    bool operator==(const ElementalPower&) const = default;
};

/// Resolved composite state of an attack.
struct CompositeState {
    ElementType element = ElementType::None;
    float power = 0.0f;

    bool operator==(const CompositeState&) const = default;
};

/// An outgoing attack.
///
/// Value type: copies are fully independent, so replaying one attack
/// against several targets only needs a copy per target. Once a composite
/// state is set the raw pairs are superseded and every reader below
/// reports the composite element and power instead.
class ElementalAttack {
public:
    ElementalAttack() = default;

    ElementalAttack(ElementType element, float power,
                    std::optional<foundation::EntityId> source = std::nullopt);

    explicit ElementalAttack(std::vector<ElementalPower> parts,
                             std::optional<foundation::EntityId> source = std::nullopt);

    /// Append a raw element/power pair.
    void AddElement(ElementType element, float power);

    /// Raw pairs in insertion order, ignoring composite state.
    [[nodiscard]] const std::vector<ElementalPower>& RawParts() const noexcept { return parts_; }

    /// Pairs as readers should see them: the single composite pair when
    /// composited, otherwise the raw pairs.
    [[nodiscard]] std::vector<ElementalPower> EffectiveParts() const;

    [[nodiscard]] const std::optional<foundation::EntityId>& Source() const noexcept {
        return source_;
    }
    void SetSource(std::optional<foundation::EntityId> source) { source_ = source; }

    [[nodiscard]] bool AllowsComposition() const noexcept { return allowComposition_; }
    void SetAllowComposition(bool allow) noexcept { allowComposition_ = allow; }

    /// Multiplier applied to composite power when this attack is composited.
    [[nodiscard]] float CompositeMultiplier() const noexcept { return compositeMultiplier_; }
    void SetCompositeMultiplier(float multiplier) noexcept { compositeMultiplier_ = multiplier; }

    void SetComposite(ElementType element, float power);
    void ClearComposite() noexcept { composite_.reset(); }

    [[nodiscard]] bool IsComposite() const noexcept { return composite_.has_value(); }
    [[nodiscard]] const std::optional<CompositeState>& Composite() const noexcept {
        return composite_;
    }

    [[nodiscard]] float GetTotalPower() const;

    /// Sum of powers for one element.
    [[nodiscard]] float GetElementPower(ElementType element) const;

    [[nodiscard]] bool HasElement(ElementType element) const;

    /// Distinct elements in first-seen order.
    [[nodiscard]] std::vector<ElementType> GetUniqueElements() const;

    [[nodiscard]] std::size_t GetElementCount() const { return GetUniqueElements().size(); }

    [[nodiscard]] bool IsMultiElement() const { return !IsComposite() && GetElementCount() > 1; }

    /// Independent copy for replay against another target.
    [[nodiscard]] ElementalAttack CreateCopy() const { return *this; }

    /// Copy with every effective power scaled by multiplier.
    [[nodiscard]] ElementalAttack WithMultiplier(float multiplier) const;

private:
    std::vector<ElementalPower> parts_;
    std::optional<foundation::EntityId> source_;
    bool allowComposition_ = true;
    float compositeMultiplier_ = 1.0f;
    std::optional<CompositeState> composite_;
};

}  // namespace elemcore::combat
