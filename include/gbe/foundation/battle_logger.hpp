#pragma once

/// @file battle_logger.hpp
/// @brief BattleLogger wrapping the kcenon logger interface for structured
///        engine diagnostics.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gbe/foundation/battle_result.hpp"

namespace gbe::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Engine log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Battle lifecycle and input validation
    Grid     = 1, ///< Occupancy store and consistency checks
    Combat   = 2, ///< Attacks, abilities, deaths
    Status   = 3, ///< Status effect application and expiry
    Movement = 4, ///< Targeting and pathing
    Wave     = 5, ///< Wave clear, transition and spawn
    Config   = 6  ///< Engine configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Grid", "Combat", "Status", "Movement", "Wave", "Config"
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
///   ctx.unitId = "knight_1";
///   ctx.tick = 42;
///   ctx.extra["cell"] = "3,4";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Grid,
///                         "occupancy repaired", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> unitId;
    std::optional<uint32_t> tick;
    std::optional<int> wave;
    std::unordered_map<std::string, std::string> extra;
};

/// Engine logger wrapping kcenon's logging interface.
///
/// Output goes to the logger registered in kcenon's GlobalLoggerRegistry
/// (a named "gbe.<Category>" logger when present, otherwise the default
/// logger). Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Grid     | Info          |
/// | Combat   | Info          |
/// | Status   | Info          |
/// | Movement | Warning       |
/// | Wave     | Info          |
/// | Config   | Info          |
class BattleLogger {
public:
    BattleLogger();
    ~BattleLogger();

    // Non-copyable, movable.
    BattleLogger(const BattleLogger&) = delete;
    BattleLogger& operator=(const BattleLogger&) = delete;
    BattleLogger(BattleLogger&&) noexcept;
    BattleLogger& operator=(BattleLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    BattleResult<void> flush();

    /// Process-wide logger used by the GBE_LOG macros.
    static BattleLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gbe::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name GBE_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GBE_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GBE_MIN_LOG_LEVEL
    #define GBE_MIN_LOG_LEVEL 0
#endif

#define GBE_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= GBE_MIN_LOG_LEVEL &&                        \
            ::gbe::foundation::BattleLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::gbe::foundation::BattleLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define GBE_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= GBE_MIN_LOG_LEVEL &&                        \
            ::gbe::foundation::BattleLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::gbe::foundation::BattleLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define GBE_LOG_DEBUG(cat, msg) \
    GBE_LOG(::gbe::foundation::LogLevel::Debug, (cat), (msg))

#define GBE_LOG_INFO(cat, msg) \
    GBE_LOG(::gbe::foundation::LogLevel::Info, (cat), (msg))

#define GBE_LOG_WARN(cat, msg) \
    GBE_LOG(::gbe::foundation::LogLevel::Warning, (cat), (msg))

#define GBE_LOG_ERROR(cat, msg) \
    GBE_LOG(::gbe::foundation::LogLevel::Error, (cat), (msg))

/// @}
