#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ELEMCORE_VERSION_MAJOR 0
#define ELEMCORE_VERSION_MINOR 3
#define ELEMCORE_VERSION_PATCH 0
#define ELEMCORE_VERSION_STRING "0.3.0"

namespace elemcore {

/// Library version information at compile time.
struct Version {
    static constexpr int major = ELEMCORE_VERSION_MAJOR;
    static constexpr int minor = ELEMCORE_VERSION_MINOR;
    static constexpr int patch = ELEMCORE_VERSION_PATCH;
    static constexpr const char* string = ELEMCORE_VERSION_STRING;
};

} // namespace elemcore
