#pragma once

/// @file engine_logger.hpp
/// @brief EngineLogger wrapping kcenon logger interfaces for combat logging.
///
/// Provides category-based filtering, structured logging with context and
/// per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "elemcore/foundation/engine_result.hpp"
#include "elemcore/foundation/types.hpp"

namespace elemcore::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core        = 0, ///< Configuration and lifecycle
    Affinity    = 1, ///< Affinity table and overrides
    Composition = 2, ///< Composite rule matching
    Resistance  = 3, ///< Resistance aggregation
    Modifier    = 4, ///< Modifier ledger
    Attack      = 5, ///< Attack building
    Resolution  = 6, ///< Damage resolution pipeline
    World       = 7  ///< Combatant registry and environment
};

inline constexpr std::size_t kLogCategoryCount = 8;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Affinity", "Composition", "Resistance",
        "Modifier", "Attack", "Resolution", "World"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = EntityId(7);
///   ctx.modifierId = "buff_fire_ward";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Modifier,
///                         "Modifier expired", ctx);
/// @endcode
struct LogContext {
    std::optional<EntityId> entityId;
    std::optional<std::string> sourceId;
    std::optional<std::string> modifierId;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Default log levels per category:
/// | Category    | Default Level |
/// |-------------|---------------|
/// | Core        | Info          |
/// | Affinity    | Info          |
/// | Composition | Debug         |
/// | Resistance  | Info          |
/// | Modifier    | Debug         |
/// | Attack      | Info          |
/// | Resolution  | Debug         |
/// | World       | Info          |
class EngineLogger {
public:
    EngineLogger();
    ~EngineLogger();

    EngineLogger(const EngineLogger&) = delete;
    EngineLogger& operator=(const EngineLogger&) = delete;
    EngineLogger(EngineLogger&&) noexcept;
    EngineLogger& operator=(EngineLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the underlying default logger.
    EngineResult<void> flush();

    /// Process-wide logger used by the ELEMCORE_LOG macros.
    static EngineLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace elemcore::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// ELEMCORE_MIN_LOG_LEVEL can be defined before including this header to
/// compile out logging calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef ELEMCORE_MIN_LOG_LEVEL
    #define ELEMCORE_MIN_LOG_LEVEL 0
#endif

#define ELEMCORE_LOG(level, cat, msg)                                                  \
    do {                                                                               \
        _Pragma("GCC diagnostic push")                                                 \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                            \
        if (static_cast<int>(level) >= ELEMCORE_MIN_LOG_LEVEL &&                       \
            ::elemcore::foundation::EngineLogger::instance().isEnabled((level), (cat))) \
        {                                                                              \
            ::elemcore::foundation::EngineLogger::instance().log((level), (cat), (msg)); \
        }                                                                              \
        _Pragma("GCC diagnostic pop")                                                  \
    } while (0)

#define ELEMCORE_LOG_DEBUG(cat, msg) \
    ELEMCORE_LOG(::elemcore::foundation::LogLevel::Debug, (cat), (msg))

#define ELEMCORE_LOG_INFO(cat, msg) \
    ELEMCORE_LOG(::elemcore::foundation::LogLevel::Info, (cat), (msg))

#define ELEMCORE_LOG_WARN(cat, msg) \
    ELEMCORE_LOG(::elemcore::foundation::LogLevel::Warning, (cat), (msg))

#define ELEMCORE_LOG_ERROR(cat, msg) \
    ELEMCORE_LOG(::elemcore::foundation::LogLevel::Error, (cat), (msg))
