#pragma once

/// @file element_types.hpp
/// @brief Element enumeration, combine methods and element flags.

#include <array>
#include <cstdint>
#include <string_view>

#include "elemcore/foundation/engine_result.hpp"

namespace elemcore::combat {

/// Elemental tag used as a lookup key throughout the engine.
///
/// None is the bare/physical element used when an attack carries no
/// elemental contribution.
enum class ElementType : uint8_t {
    None,
    Fire,
    Water,
    Wind,
    Earth,
    Light,
    Dark,
    Lightning,
    Ice,
    Poison,
    Holy,
    Void
};

/// Number of distinct elements (for array sizing).
constexpr std::size_t kElementCount = 12;

/// All elements in declaration order.
constexpr std::array<ElementType, kElementCount> kAllElements = {
    ElementType::None,  ElementType::Fire,      ElementType::Water, ElementType::Wind,
    ElementType::Earth, ElementType::Light,     ElementType::Dark,  ElementType::Lightning,
    ElementType::Ice,   ElementType::Poison,    ElementType::Holy,  ElementType::Void
};

/// Canonical name of an element ("Fire", "None", ...).
constexpr std::string_view elementName(ElementType element) {
    constexpr std::array<std::string_view, kElementCount> names = {
        "None", "Fire", "Water", "Wind", "Earth", "Light",
        "Dark", "Lightning", "Ice", "Poison", "Holy", "Void"
    };
    auto idx = static_cast<std::size_t>(element);
    return idx < kElementCount ? names[idx] : "Unknown";
}

/// Parse a canonical element name (case-sensitive).
/// @return The element or an InvalidElement error.
foundation::EngineResult<ElementType> parseElement(std::string_view name);

/// Power combination strategy for a composite rule.
enum class CombineMethod : uint8_t {
    Average,     ///< Arithmetic mean of all contributing powers.
    Highest,     ///< Largest contributing power.
    Lowest,      ///< Smallest contributing power.
    Weighted,    ///< Weighted mean using the rule's weight table.
    CustomCurve  ///< Average mapped through the rule's response curve.
};

/// Classification flags on an element definition.
enum class ElementFlags : uint8_t {
    None          = 0,
    Physical      = 1 << 0,
    Magical       = 1 << 1,
    Healing       = 1 << 2,
    Debuff        = 1 << 3,
    Environmental = 1 << 4,
    Ethereal      = 1 << 5
};

constexpr ElementFlags operator|(ElementFlags a, ElementFlags b) noexcept {
    return static_cast<ElementFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr bool hasFlag(ElementFlags set, ElementFlags flag) noexcept {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(flag)) != 0;
}

}  // namespace elemcore::combat
