#pragma once

/// @file elemcore.hpp
/// @brief Umbrella header for the elemental combat engine.

#include "elemcore/version.hpp"
#include "elemcore/core/result.hpp"
#include "elemcore/foundation/foundation.hpp"
#include "elemcore/combat/combat.hpp"
