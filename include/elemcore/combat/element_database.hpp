#pragma once

/// @file element_database.hpp
/// @brief Element definitions, on-hit effects and the shared rule tables.

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "elemcore/combat/affinity_table.hpp"
#include "elemcore/combat/composition_resolver.hpp"
#include "elemcore/combat/element_types.hpp"
#include "elemcore/combat/environment_profile.hpp"

namespace elemcore::combat {

/// On-hit effect attached to an element definition.
struct ElementalEffect {
    using TriggerPredicate = std::function<bool(float damage, ElementType element)>;

    std::string effectId;
    std::string effectName;
    ElementType triggerElement = ElementType::None;
    float basePower = 10.0f;
    float duration = 5.0f;
    std::vector<std::string> statusEffectIds;

    /// Optional custom trigger; without one the effect fires when the
    /// attack element equals triggerElement.
    TriggerPredicate triggerPredicate;

    [[nodiscard]] bool ShouldApply(float damage, ElementType element) const {
        if (triggerPredicate) {
            return triggerPredicate(damage, element);
        }
        return element == triggerElement;
    }
};

struct ElementDefinition {
    ElementType element = ElementType::None;
    std::string elementId;
    std::string displayName;
    ElementFlags flags = ElementFlags::None;
    std::vector<ElementalEffect> effects;

    [[nodiscard]] bool HasFlag(ElementFlags flag) const noexcept { return hasFlag(flags, flag); }
};

/// Read-mostly rule data shared by every resolution in a world.
///
/// Writes are expected during setup only; concurrent readers need
/// external synchronization around any later change.
class ElementDatabase {
public:
    ElementDatabase() = default;
    explicit ElementDatabase(AffinityTable affinities);

    /// Default affinity matrix, no definitions, rules or environments.
    [[nodiscard]] static ElementDatabase CreateDefault();

    /// Add a definition, replacing any existing one for the same element.
    void AddDefinition(ElementDefinition definition);

    [[nodiscard]] const ElementDefinition* GetDefinition(ElementType element) const;
    [[nodiscard]] const ElementDefinition* GetDefinition(std::string_view elementId) const;

    [[nodiscard]] const std::vector<ElementDefinition>& Definitions() const noexcept { return definitions_; }

    [[nodiscard]] std::vector<const ElementDefinition*> GetElementsByFlag(ElementFlags flag) const;

    [[nodiscard]] AffinityTable& Affinities() noexcept { return affinities_; }
    [[nodiscard]] const AffinityTable& Affinities() const noexcept { return affinities_; }

    [[nodiscard]] CompositionResolver& Composition() noexcept { return composition_; }
    [[nodiscard]] const CompositionResolver& Composition() const noexcept { return composition_; }

    /// Add an environment, replacing any existing one with the same id.
    void AddEnvironment(EnvironmentProfile environment);

    [[nodiscard]] const EnvironmentProfile* GetEnvironment(std::string_view environmentId) const;

    [[nodiscard]] const std::vector<EnvironmentProfile>& Environments() const noexcept { return environments_; }

private:
    std::vector<ElementDefinition> definitions_;
    AffinityTable affinities_;
    CompositionResolver composition_;
    std::vector<EnvironmentProfile> environments_;
};

}  // namespace elemcore::combat
