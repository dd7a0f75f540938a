#pragma once

/// @file combat_test_support.hpp
/// @brief Deterministic collaborators shared by the combat tests.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "elemcore/combat/external_interfaces.hpp"
#include "elemcore/foundation/random_source.hpp"

namespace elemcore::combat::testing {

/// Random source returning fixed values.
/// Range() returns `rangeValue` when set, otherwise min.
class FixedRandomSource final : public foundation::IRandomSource {
public:
    explicit FixedRandomSource(float unit = 0.5f) : unit(unit) {}

    float NextUnit() override {
        ++unitDraws;
        return unit;
    }

    float Range(float min, float max) override {
        ++rangeDraws;
        if (rangeValue) {
            return *rangeValue;
        }
        return min;
    }

    float unit;
    std::optional<float> rangeValue;
    int unitDraws = 0;
    int rangeDraws = 0;
};

/// Stat accessor backed by a map; records every damage application.
class MapStatAccessor final : public IStatAccessor {
public:
    void Set(foundation::EntityId entity, StatKind kind, float value) {
        stats_[{entity.value(), kind}] = value;
    }

    std::optional<float> GetStat(foundation::EntityId entity, StatKind kind) const override {
        auto it = stats_.find({entity.value(), kind});
        if (it == stats_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void ApplyDamage(foundation::EntityId entity, float amount) override {
        applied.emplace_back(entity, amount);
    }

    std::vector<std::pair<foundation::EntityId, float>> applied;

private:
    std::map<std::pair<uint64_t, StatKind>, float> stats_;
};

/// Status-effect applicator that records offers and accepts them all
/// unless `accept` is cleared.
class RecordingApplicator final : public IStatusEffectApplicator {
public:
    struct Offer {
        std::string effectId;
        ElementType element;
        foundation::EntityId target;
    };

    bool TryApplyEffect(std::string_view effectId, ElementType element,
                        foundation::EntityId target) override {
        offers.push_back({std::string(effectId), element, target});
        return accept;
    }

    std::vector<Offer> offers;
    bool accept = true;
};

}  // namespace elemcore::combat::testing
