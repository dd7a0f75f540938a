/// @file element_database.cpp
/// @brief ElementDatabase implementation.

#include "elemcore/combat/element_database.hpp"

#include <algorithm>

namespace elemcore::combat {

ElementDatabase::ElementDatabase(AffinityTable affinities) : affinities_(std::move(affinities)) {}

ElementDatabase ElementDatabase::CreateDefault() {
    return ElementDatabase(AffinityTable::CreateDefault());
}

void ElementDatabase::AddDefinition(ElementDefinition definition) {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&definition](const ElementDefinition& d) {
                               return d.element == definition.element;
                           });
    if (it != definitions_.end()) {
        *it = std::move(definition);
    } else {
        definitions_.push_back(std::move(definition));
    }
}

const ElementDefinition* ElementDatabase::GetDefinition(ElementType element) const {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [element](const ElementDefinition& d) { return d.element == element; });
    return it != definitions_.end() ? &*it : nullptr;
}

const ElementDefinition* ElementDatabase::GetDefinition(std::string_view elementId) const {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [elementId](const ElementDefinition& d) { return d.elementId == elementId; });
    return it != definitions_.end() ? &*it : nullptr;
}

std::vector<const ElementDefinition*> ElementDatabase::GetElementsByFlag(ElementFlags flag) const {
    std::vector<const ElementDefinition*> result;
    for (const auto& definition : definitions_) {
        if (definition.HasFlag(flag)) {
            result.push_back(&definition);
        }
    }
    return result;
}

void ElementDatabase::AddEnvironment(EnvironmentProfile environment) {
    auto it = std::find_if(environments_.begin(), environments_.end(),
                           [&environment](const EnvironmentProfile& e) { return e.id == environment.id; });
    if (it != environments_.end()) {
        *it = std::move(environment);
    } else {
        environments_.push_back(std::move(environment));
    }
}

const EnvironmentProfile* ElementDatabase::GetEnvironment(std::string_view environmentId) const {
    auto it = std::find_if(environments_.begin(), environments_.end(),
                           [environmentId](const EnvironmentProfile& e) { return e.id == environmentId; });
    return it != environments_.end() ? &*it : nullptr;
}

}  // namespace elemcore::combat
