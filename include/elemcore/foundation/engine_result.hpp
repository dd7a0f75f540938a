#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> alias for engine error handling.

#include "elemcore/core/result.hpp"
#include "elemcore/foundation/engine_error.hpp"

namespace elemcore::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<void> apply(const Modifier& m) {
///       if (m.id.empty()) {
///           return EngineResult<void>::err(
///               EngineError(ErrorCode::InvalidModifier, "modifier id is empty"));
///       }
///       return EngineResult<void>::ok();
///   }
/// @endcode
template <typename T>
using EngineResult = elemcore::Result<T, EngineError>;

} // namespace elemcore::foundation
