#pragma once

/// @file foundation.hpp
/// @brief Aggregate header for the engine foundation layer.
///
/// Error types, Result aliases, strong IDs, configuration, logging,
/// signals and randomness.

#include "elemcore/foundation/config_manager.hpp"
#include "elemcore/foundation/engine_error.hpp"
#include "elemcore/foundation/engine_logger.hpp"
#include "elemcore/foundation/engine_result.hpp"
#include "elemcore/foundation/error_code.hpp"
#include "elemcore/foundation/random_source.hpp"
#include "elemcore/foundation/signal.hpp"
#include "elemcore/foundation/types.hpp"
