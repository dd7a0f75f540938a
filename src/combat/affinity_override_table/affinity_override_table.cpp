/// @file affinity_override_table.cpp
/// @brief AffinityOverrideTable implementation.

#include "elemcore/combat/affinity_override_table.hpp"

#include <algorithm>

namespace elemcore::combat {

void AffinityOverrideTable::AddOverride(std::string overrideId, ElementType attack,
                                        ElementType defense, float newAffinity,
                                        std::optional<float> duration, std::string sourceId) {
    AffinityOverride entry{attack, defense, newAffinity, duration, std::move(sourceId)};

    // Replacing moves the entry to the back so it becomes the newest match.
    RemoveOverride(overrideId);
    overrides_.emplace_back(std::move(overrideId), std::move(entry));
    ++version_;
}

bool AffinityOverrideTable::RemoveOverride(std::string_view overrideId) {
    auto removed = std::erase_if(overrides_, [overrideId](const auto& entry) {
        return entry.first == overrideId;
    });
    if (removed > 0) {
        ++version_;
    }
    return removed > 0;
}

std::size_t AffinityOverrideTable::RemoveOverridesBySource(std::string_view sourceId) {
    auto removed = std::erase_if(overrides_, [sourceId](const auto& entry) {
        return entry.second.sourceId == sourceId;
    });
    if (removed > 0) {
        ++version_;
    }
    return removed;
}

std::optional<float> AffinityOverrideTable::GetOverride(ElementType attack,
                                                        ElementType defense) const {
    for (auto it = overrides_.rbegin(); it != overrides_.rend(); ++it) {
        const auto& entry = it->second;
        if (entry.attackElement == attack && entry.defenseElement == defense) {
            return entry.newAffinity;
        }
    }
    return std::nullopt;
}

void AffinityOverrideTable::Tick(float deltaTime) {
    for (auto& [id, entry] : overrides_) {
        if (entry.remainingDuration) {
            *entry.remainingDuration -= deltaTime;
        }
    }
    auto expired = std::erase_if(overrides_, [](const auto& entry) {
        return entry.second.remainingDuration && *entry.second.remainingDuration <= 0.0f;
    });
    if (expired > 0) {
        ++version_;
    }
}

bool AffinityOverrideTable::HasOverride(std::string_view overrideId) const {
    return std::any_of(overrides_.begin(), overrides_.end(),
                       [overrideId](const auto& entry) { return entry.first == overrideId; });
}

void AffinityOverrideTable::Clear() {
    if (!overrides_.empty()) {
        overrides_.clear();
        ++version_;
    }
}

}  // namespace elemcore::combat
