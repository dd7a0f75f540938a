/// @file resistance_aggregator.cpp
/// @brief ResistanceAggregator implementation.

#include "elemcore/combat/resistance_aggregator.hpp"

#include <algorithm>

namespace elemcore::combat {

float ResistanceAggregator::Diminish(float sum) noexcept {
    if (sum > 0.0f) {
        return sum / (sum + 1.0f);
    }
    if (sum < 0.0f) {
        return sum / (1.0f - sum);
    }
    return 0.0f;
}

ResistanceProfile ResistanceAggregator::Aggregate(const std::vector<ResistanceProfile>& sources) {
    // Sum per element, keeping first-seen order.
    std::vector<std::pair<ElementType, float>> sums;
    for (const auto& source : sources) {
        for (const auto& [element, value] : source.resistances) {
            if (value == 0.0f) {
                continue;
            }
            auto it = std::find_if(sums.begin(), sums.end(),
                                   [element](const auto& entry) { return entry.first == element; });
            if (it == sums.end()) {
                sums.emplace_back(element, value);
            } else {
                it->second += value;
            }
        }
    }

    ResistanceProfile result;
    float best = 0.0f;
    for (const auto& [element, sum] : sums) {
        float effective = Diminish(sum);
        result.SetResistance(element, effective);
        if (effective > best) {
            best = effective;
            result.primaryElement = element;
        }
    }

    for (const auto& source : sources) {
        for (auto element : source.immunities) {
            result.AddImmunity(element);
        }
        for (auto element : source.weaknesses) {
            result.AddWeakness(element);
        }
    }
    return result;
}

// ── Source tables ───────────────────────────────────────────────────────

void ResistanceAggregator::upsert(SourceTable& table, std::string id, ResistanceProfile profile) {
    auto it = std::find_if(table.begin(), table.end(),
                           [&id](const auto& entry) { return entry.first == id; });
    if (it != table.end()) {
        it->second = std::move(profile);
    } else {
        table.emplace_back(std::move(id), std::move(profile));
    }
    ++version_;
}

bool ResistanceAggregator::erase(SourceTable& table, std::string_view id) {
    auto removed = std::erase_if(table, [id](const auto& entry) { return entry.first == id; });
    if (removed == 0) {
        return false;
    }
    ++version_;
    return true;
}

void ResistanceAggregator::RegisterEquipment(std::string equipmentId, ResistanceProfile profile) {
    upsert(equipment_, std::move(equipmentId), std::move(profile));
}

bool ResistanceAggregator::RemoveEquipment(std::string_view equipmentId) {
    return erase(equipment_, equipmentId);
}

void ResistanceAggregator::RegisterPassive(std::string passiveId, ResistanceProfile profile) {
    upsert(passives_, std::move(passiveId), std::move(profile));
}

bool ResistanceAggregator::RemovePassive(std::string_view passiveId) {
    return erase(passives_, passiveId);
}

void ResistanceAggregator::AddTemporary(std::string effectId, ResistanceProfile profile) {
    upsert(temporary_, std::move(effectId), std::move(profile));
}

bool ResistanceAggregator::RemoveTemporary(std::string_view effectId) {
    return erase(temporary_, effectId);
}

void ResistanceAggregator::ClearTemporary() {
    if (temporary_.empty()) {
        return;
    }
    temporary_.clear();
    ++version_;
}

bool ResistanceAggregator::HasTemporary(std::string_view effectId) const {
    return std::any_of(temporary_.begin(), temporary_.end(),
                       [effectId](const auto& entry) { return entry.first == effectId; });
}

ResistanceProfile ResistanceAggregator::CalculateTotal() const {
    std::vector<ResistanceProfile> sources;
    sources.reserve(equipment_.size() + passives_.size() + temporary_.size());
    for (const auto* table : {&equipment_, &passives_, &temporary_}) {
        for (const auto& [id, profile] : *table) {
            sources.push_back(profile);
        }
    }
    return Aggregate(sources);
}

}  // namespace elemcore::combat
