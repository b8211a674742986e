#pragma once

/// @file auth_logger.hpp
/// @brief AuthLogger wrapping kcenon logger_system for structured logging
///        in the authentication core.
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

#include "cas/foundation/auth_result.hpp"

namespace cas::foundation {

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

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, orchestration
    Token   = 1, ///< Code, refresh, MFA and access token lifecycle
    Crypto  = 2, ///< Keys, encryption, signatures
    Client  = 3, ///< OAuth client registry
    Storage = 4, ///< Persistence collaborators
    Config  = 5  ///< Configuration loading
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Token", "Crypto", "Client", "Storage", "Config"
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

/// Structured context data attached to log entries.
///
/// Never put plaintext tokens, client secrets or key material in here;
/// record ids and hash prefixes are enough to correlate.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = record.userId;
///   ctx.recordId = record.id;
///   ctx.extra["reason"] = "expired";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Token,
///                         "Refresh token rejected", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> userId;
    std::optional<std::string> tenantId;
    std::optional<std::string> clientId;
    std::optional<std::string> recordId;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Token    | Info          |
/// | Crypto   | Info          |
/// | Client   | Info          |
/// | Storage  | Warning       |
/// | Config   | Info          |
class AuthLogger {
public:
    AuthLogger();
    ~AuthLogger();

    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;
    AuthLogger(AuthLogger&&) noexcept;
    AuthLogger& operator=(AuthLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    AuthResult<void> flush();

    /// Get the process-wide AuthLogger instance.
    static AuthLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse a level name ("debug", "WARNING", ...). Unknown names yield nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace cas::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace, macros are global)
// ---------------------------------------------------------------------------

/// @name CAS_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CAS_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CAS_MIN_LOG_LEVEL
    #define CAS_MIN_LOG_LEVEL 0
#endif

#define CAS_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL &&                       \
            ::cas::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::cas::foundation::AuthLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define CAS_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= CAS_MIN_LOG_LEVEL &&                       \
            ::cas::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::cas::foundation::AuthLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define CAS_LOG_DEBUG(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Debug, (cat), (msg))

#define CAS_LOG_INFO(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Info, (cat), (msg))

#define CAS_LOG_WARN(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Warning, (cat), (msg))

#define CAS_LOG_ERROR(cat, msg) \
    CAS_LOG(::cas::foundation::LogLevel::Error, (cat), (msg))

/// @}
