#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the elemental combat engine.

#include <cstdint>
#include <string_view>

namespace elemcore::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Element (0x0100 - 0x01FF)
    InvalidElement = 0x0100,
    InvalidCompositeRule = 0x0101,
    EnvironmentNotFound = 0x0102,
    CombatantNotFound = 0x0103,

    // Modifier (0x0200 - 0x02FF)
    InvalidModifier = 0x0200,
    ModifierNotFound = 0x0201,
    InvalidStacking = 0x0202,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Element";
        case 0x0200: return "Modifier";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace elemcore::foundation
