#pragma once

/// @file composition_resolver.hpp
/// @brief Composite rules and the resolver merging multi-element attacks.

#include <string>
#include <utility>
#include <vector>

#include "elemcore/combat/attack.hpp"
#include "elemcore/combat/element_types.hpp"
#include "elemcore/foundation/engine_result.hpp"

namespace elemcore::combat {

/// Power scale used to normalize input for CombineMethod::CustomCurve.
constexpr float kCurvePowerScale = 100.0f;

/// Monotonic piecewise-linear curve over [x, y] keys.
///
/// Input outside the key range is clamped to the first/last key.
class ResponseCurve {
public:
    ResponseCurve() = default;

    /// Keys are sorted by x on construction.
    explicit ResponseCurve(std::vector<std::pair<float, float>> keys);

    /// Identity curve from (0,0) to (1,1).
    [[nodiscard]] static ResponseCurve Linear();

    [[nodiscard]] float Evaluate(float x) const;

    /// True if y never decreases as x increases.
    [[nodiscard]] bool IsMonotonic() const;

    [[nodiscard]] const std::vector<std::pair<float, float>>& Keys() const noexcept { return keys_; }

private:
    std::vector<std::pair<float, float>> keys_;
};

/// Per-element weight for CombineMethod::Weighted.
struct ElementWeight {
    ElementType element = ElementType::None;
    float weight = 1.0f;
};

/// A rule merging several elements into one composite element.
struct CompositeRule {
    std::string name;
    std::vector<ElementType> inputElements;   ///< Must all be present.
    std::vector<ElementWeight> elementWeights;
    CombineMethod combineMethod = CombineMethod::Average;
    ResponseCurve customCurve = ResponseCurve::Linear();
    ElementType resultElement = ElementType::None;  ///< None = first attack element.
    float powerMultiplier = 1.0f;
    float minimumPowerThreshold = 0.0f;
    std::size_t requiredElementCount = 2;     ///< Minimum distinct attack elements.

    /// True if the attack's pairs satisfy the element subset, element
    /// count and total power threshold.
    [[nodiscard]] bool CanCombine(const std::vector<ElementalPower>& parts) const;

    /// Combined power of the pairs with this rule's strategy, before
    /// powerMultiplier. Empty input yields 0.
    [[nodiscard]] float CombinePowers(const std::vector<ElementalPower>& parts) const;

    /// Weight for an element, 1.0 when not listed.
    [[nodiscard]] float GetElementWeight(ElementType element) const;

    /// Reject rules that cannot be evaluated sensibly.
    [[nodiscard]] foundation::EngineResult<void> Validate() const;
};

/// Outcome of trying to composite an attack.
struct CompositionResult {
    ElementType element = ElementType::None;
    float power = 0.0f;
    bool isComposite = false;
    std::string ruleName;
    std::vector<ElementType> sourceElements;
};

/// Matches composite rules against an attack's element/power pairs.
///
/// Rules are kept ordered by specificity: rules naming more input
/// elements are tried first, and rules of equal specificity keep their
/// insertion order.
class CompositionResolver {
public:
    /// Add a rule. Invalid rules are rejected and logged.
    foundation::EngineResult<void> AddRule(CompositeRule rule);

    [[nodiscard]] const std::vector<CompositeRule>& Rules() const noexcept { return rules_; }

    void Clear() { rules_.clear(); }

    /// Try every rule in specificity order; the first match wins.
    ///
    /// Without a match the first pair is returned as a non-composite
    /// representative. Attacks with fewer than two distinct elements are
    /// never composited.
    [[nodiscard]] CompositionResult TryCombine(const std::vector<ElementalPower>& parts) const;

private:
    std::vector<CompositeRule> rules_;
};

}  // namespace elemcore::combat
