/// @file composition_resolver.cpp
/// @brief ResponseCurve, CompositeRule and CompositionResolver implementation.

#include "elemcore/combat/composition_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::vector<ElementType> uniqueElements(const std::vector<ElementalPower>& parts) {
    std::vector<ElementType> unique;
    for (const auto& part : parts) {
        if (std::find(unique.begin(), unique.end(), part.element) == unique.end()) {
            unique.push_back(part.element);
        }
    }
    return unique;
}

float averagePower(const std::vector<ElementalPower>& parts) {
    if (parts.empty()) {
        return 0.0f;
    }
    float sum = 0.0f;
    for (const auto& part : parts) {
        sum += part.power;
    }
    return sum / static_cast<float>(parts.size());
}

}  // namespace

// ── ResponseCurve ───────────────────────────────────────────────────────

ResponseCurve::ResponseCurve(std::vector<std::pair<float, float>> keys) : keys_(std::move(keys)) {
    std::stable_sort(keys_.begin(), keys_.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
}

ResponseCurve ResponseCurve::Linear() {
    return ResponseCurve({{0.0f, 0.0f}, {1.0f, 1.0f}});
}

float ResponseCurve::Evaluate(float x) const {
    if (keys_.empty()) {
        return x;
    }
    if (x <= keys_.front().first) {
        return keys_.front().second;
    }
    if (x >= keys_.back().first) {
        return keys_.back().second;
    }
    for (std::size_t i = 1; i < keys_.size(); ++i) {
        const auto& [x1, y1] = keys_[i];
        if (x <= x1) {
            const auto& [x0, y0] = keys_[i - 1];
            float span = x1 - x0;
            if (span <= 0.0f) {
                return y1;
            }
            float t = (x - x0) / span;
            return y0 + (y1 - y0) * t;
        }
    }
    return keys_.back().second;
}

bool ResponseCurve::IsMonotonic() const {
    for (std::size_t i = 1; i < keys_.size(); ++i) {
        if (keys_[i].second < keys_[i - 1].second) {
            return false;
        }
    }
    return true;
}

// ── CompositeRule ───────────────────────────────────────────────────────

bool CompositeRule::CanCombine(const std::vector<ElementalPower>& parts) const {
    auto elements = uniqueElements(parts);
    if (elements.size() < std::max<std::size_t>(requiredElementCount, 2)) {
        return false;
    }
    for (auto required : inputElements) {
        if (std::find(elements.begin(), elements.end(), required) == elements.end()) {
            return false;
        }
    }
    float total = 0.0f;
    for (const auto& part : parts) {
        total += part.power;
    }
    return total >= minimumPowerThreshold;
}

float CompositeRule::GetElementWeight(ElementType element) const {
    for (const auto& w : elementWeights) {
        if (w.element == element) {
            return w.weight;
        }
    }
    return 1.0f;
}

float CompositeRule::CombinePowers(const std::vector<ElementalPower>& parts) const {
    if (parts.empty()) {
        return 0.0f;
    }

    switch (combineMethod) {
        case CombineMethod::Average:
            return averagePower(parts);

        case CombineMethod::Highest:
            return std::max_element(parts.begin(), parts.end(),
                                    [](const auto& a, const auto& b) { return a.power < b.power; })
                ->power;

        case CombineMethod::Lowest:
            return std::min_element(parts.begin(), parts.end(),
                                    [](const auto& a, const auto& b) { return a.power < b.power; })
                ->power;

        case CombineMethod::Weighted: {
            float weightedSum = 0.0f;
            float totalWeight = 0.0f;
            for (const auto& part : parts) {
                float weight = GetElementWeight(part.element);
                weightedSum += part.power * weight;
                totalWeight += weight;
            }
            return totalWeight > 0.0f ? weightedSum / totalWeight : 0.0f;
        }

        case CombineMethod::CustomCurve: {
            float normalized = std::clamp(averagePower(parts) / kCurvePowerScale, 0.0f, 1.0f);
            return customCurve.Evaluate(normalized) * kCurvePowerScale;
        }
    }
    return parts.front().power;
}

EngineResult<void> CompositeRule::Validate() const {
    if (inputElements.empty()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidCompositeRule, "composite rule '" + name + "' has no input elements"));
    }
    if (!std::isfinite(powerMultiplier) || powerMultiplier < 0.0f) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidCompositeRule,
                        "composite rule '" + name + "' has a negative or non-finite power multiplier"));
    }
    if (combineMethod == CombineMethod::CustomCurve && !customCurve.IsMonotonic()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidCompositeRule, "composite rule '" + name + "' curve is not monotonic"));
    }
    return EngineResult<void>::ok();
}

// ── CompositionResolver ─────────────────────────────────────────────────

EngineResult<void> CompositionResolver::AddRule(CompositeRule rule) {
    auto valid = rule.Validate();
    if (valid.hasError()) {
        ELEMCORE_LOG_WARN(LogCategory::Composition, std::string(valid.error().message()));
        return valid;
    }

    // Insert after every rule at least as specific as this one.
    auto pos = std::find_if(rules_.begin(), rules_.end(), [&rule](const CompositeRule& r) {
        return r.inputElements.size() < rule.inputElements.size();
    });
    rules_.insert(pos, std::move(rule));
    return EngineResult<void>::ok();
}

CompositionResult CompositionResolver::TryCombine(const std::vector<ElementalPower>& parts) const {
    CompositionResult result;
    if (!parts.empty()) {
        result.element = parts.front().element;
        result.power = parts.front().power;
    }
    result.sourceElements = uniqueElements(parts);

    if (result.sourceElements.size() < 2) {
        return result;
    }

    for (const auto& rule : rules_) {
        if (!rule.CanCombine(parts)) {
            continue;
        }
        result.isComposite = true;
        result.element = rule.resultElement != ElementType::None ? rule.resultElement
                                                                 : parts.front().element;
        result.power = rule.CombinePowers(parts) * rule.powerMultiplier;
        result.ruleName = rule.name;

        ELEMCORE_LOG_DEBUG(LogCategory::Composition,
                           "Rule '" + rule.name + "' produced " +
                               std::string(elementName(result.element)) + " at power " +
                               std::to_string(result.power));
        return result;
    }
    return result;
}

}  // namespace elemcore::combat
