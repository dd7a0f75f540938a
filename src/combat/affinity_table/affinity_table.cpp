/// @file affinity_table.cpp
/// @brief AffinityTable implementation.

#include "elemcore/combat/affinity_table.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "elemcore/foundation/engine_logger.hpp"

namespace elemcore::combat {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

namespace {

std::size_t index(ElementType element) {
    return static_cast<std::size_t>(element);
}

}  // namespace

AffinityTable::AffinityTable() : lookupOnce_(std::make_unique<std::once_flag>()) {}

AffinityTable::AffinityTable(AffinityMatrix matrix)
    : matrix_(std::move(matrix)), lookupOnce_(std::make_unique<std::once_flag>()) {}

// The source is left as an empty table with its own flag, so it stays
// usable after the move.
AffinityTable::AffinityTable(AffinityTable&& other)
    : matrix_(std::move(other.matrix_)),
      lookup_(other.lookup_),
      lookupOnce_(std::exchange(other.lookupOnce_, std::make_unique<std::once_flag>())) {
    other.matrix_ = AffinityMatrix{};
    other.lookup_ = Lookup{};
}

AffinityTable& AffinityTable::operator=(AffinityTable&& other) {
    if (this != &other) {
        matrix_ = std::exchange(other.matrix_, AffinityMatrix{});
        lookup_ = std::exchange(other.lookup_, Lookup{});
        lookupOnce_ = std::exchange(other.lookupOnce_, std::make_unique<std::once_flag>());
    }
    return *this;
}

void AffinityTable::ensureLookup() const {
    std::call_once(*lookupOnce_, [this] {
        lookup_ = Lookup{};
        const auto& columns = matrix_.supportedElements;
        for (const auto& row : matrix_.rows) {
            auto count = std::min(row.defenseAffinities.size(), columns.size());
            for (std::size_t j = 0; j < count; ++j) {
                lookup_[index(row.attackElement)][index(columns[j])] = row.defenseAffinities[j];
            }
        }
    });
}

float AffinityTable::Get(ElementType attack, ElementType defense) const {
    ensureLookup();
    auto a = index(attack);
    auto d = index(defense);
    if (a >= kElementCount || d >= kElementCount) {
        return kNeutralAffinity;
    }
    return lookup_[a][d].value_or(kNeutralAffinity);
}

bool AffinityTable::Has(ElementType attack, ElementType defense) const {
    ensureLookup();
    auto a = index(attack);
    auto d = index(defense);
    return a < kElementCount && d < kElementCount && lookup_[a][d].has_value();
}

void AffinityTable::Set(ElementType attack, ElementType defense, float value) {
    ensureLookup();
    if (index(attack) >= kElementCount || index(defense) >= kElementCount) {
        return;
    }
    lookup_[index(attack)][index(defense)] = value;

    // Write through to the persisted matrix, growing it when the pair is
    // outside the current rows/columns.
    auto& columns = matrix_.supportedElements;
    auto colIt = std::find(columns.begin(), columns.end(), defense);
    if (colIt == columns.end()) {
        columns.push_back(defense);
        for (auto& row : matrix_.rows) {
            row.defenseAffinities.resize(columns.size() - 1, kNeutralAffinity);
            row.defenseAffinities.push_back(
                lookup_[index(row.attackElement)][index(defense)].value_or(kNeutralAffinity));
        }
        colIt = columns.end() - 1;
    }
    auto col = static_cast<std::size_t>(colIt - columns.begin());

    auto rowIt = std::find_if(matrix_.rows.begin(), matrix_.rows.end(),
                              [attack](const AffinityRow& r) { return r.attackElement == attack; });
    if (rowIt == matrix_.rows.end()) {
        AffinityRow row;
        row.attackElement = attack;
        for (auto column : columns) {
            row.defenseAffinities.push_back(
                lookup_[index(attack)][index(column)].value_or(kNeutralAffinity));
        }
        matrix_.rows.push_back(std::move(row));
        return;
    }
    if (rowIt->defenseAffinities.size() <= col) {
        rowIt->defenseAffinities.resize(col + 1, kNeutralAffinity);
    }
    rowIt->defenseAffinities[col] = value;
}

float AffinityTable::DefaultAffinity(ElementType attack, ElementType defense) {
    using E = ElementType;
    struct Pair {
        E attack;
        E defense;
        float value;
    };
    static constexpr Pair kRelations[] = {
        {E::Fire, E::Water, 0.5f},      {E::Fire, E::Ice, 1.5f},
        {E::Fire, E::Earth, 1.2f},      {E::Water, E::Fire, 1.5f},
        {E::Water, E::Lightning, 0.5f}, {E::Water, E::Earth, 1.2f},
        {E::Wind, E::Earth, 1.5f},      {E::Wind, E::Fire, 1.2f},
        {E::Earth, E::Wind, 0.5f},      {E::Earth, E::Water, 0.8f},
        {E::Light, E::Dark, 1.5f},      {E::Dark, E::Light, 1.5f},
        {E::Lightning, E::Water, 1.5f}, {E::Ice, E::Fire, 0.5f},
    };
    for (const auto& rel : kRelations) {
        if (rel.attack == attack && rel.defense == defense) {
            return rel.value;
        }
    }
    // Same-element hits are resisted.
    return attack == defense ? 0.5f : kNeutralAffinity;
}

AffinityTable AffinityTable::CreateDefault() {
    AffinityMatrix matrix;
    for (auto element : kAllElements) {
        if (element != ElementType::None) {
            matrix.supportedElements.push_back(element);
        }
    }
    for (auto attack : matrix.supportedElements) {
        AffinityRow row;
        row.attackElement = attack;
        for (auto defense : matrix.supportedElements) {
            row.defenseAffinities.push_back(DefaultAffinity(attack, defense));
        }
        matrix.rows.push_back(std::move(row));
    }
    return AffinityTable(std::move(matrix));
}

EngineResult<AffinityTable> AffinityTable::LoadFromConfig(
    const foundation::ConfigManager& config, std::string_view prefix) {
    std::string base(prefix);

    auto names = config.get<std::vector<std::string>>(base + ".elements");
    if (names.hasError()) {
        return EngineResult<AffinityTable>::err(names.error());
    }

    AffinityMatrix matrix;
    for (const auto& name : names.value()) {
        auto element = parseElement(name);
        if (element.hasError()) {
            return EngineResult<AffinityTable>::err(element.error());
        }
        matrix.supportedElements.push_back(element.value());
    }

    std::string rowPrefix = base + ".rows";
    for (const auto& key : config.keysWithPrefix(rowPrefix)) {
        auto attackName = std::string_view(key).substr(rowPrefix.size() + 1);
        auto attack = parseElement(attackName);
        if (attack.hasError()) {
            return EngineResult<AffinityTable>::err(attack.error());
        }
        auto values = config.get<std::vector<float>>(key);
        if (values.hasError()) {
            return EngineResult<AffinityTable>::err(values.error());
        }
        if (values.value().size() != matrix.supportedElements.size()) {
            return EngineResult<AffinityTable>::err(EngineError(
                ErrorCode::ConfigInvalidValue,
                "affinity row '" + std::string(attackName) + "' has " +
                    std::to_string(values.value().size()) + " values, expected " +
                    std::to_string(matrix.supportedElements.size())));
        }
        matrix.rows.push_back({attack.value(), std::move(values).value()});
    }

    ELEMCORE_LOG_INFO(foundation::LogCategory::Affinity,
                      "Loaded affinity matrix with " + std::to_string(matrix.rows.size()) +
                          " rows from '" + base + "'");
    return EngineResult<AffinityTable>::ok(AffinityTable(std::move(matrix)));
}

}  // namespace elemcore::combat
