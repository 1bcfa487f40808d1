#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Include this header to log errors before they propagate.
 * This file bridges Error.hpp and LogService.hpp.
 */

#include <cadence/core/Error.hpp>
#include <cadence/io/LogService.hpp>

namespace cadence {

/**
 * @brief Convert error severity to log level
 */
inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 *
 * The node path and stage recorded on the error take precedence over the
 * thread-local context, so the entry names the node that failed even when
 * it is logged from an enclosing scope.
 */
inline void LogError(const Error &error) {
    LogLevel level = SeverityToLogLevel(error.severity());
    if (error.has_node()) {
        LogContext ctx;
        ctx.path = error.node_path();
        ctx.stage = error.stage_name();
        GetLogService().Log(level, error.what(), ctx);
    } else {
        GetLogService().Log(level, error.what());
    }
}

/**
 * @brief Throw an error after logging it
 *
 * Usage:
 * @code
 * ThrowAndLog(NotReadyError("frame 'wheel' is not connected"));
 * @endcode
 */
template <typename E> [[noreturn]] void ThrowAndLog(E &&error) {
    LogError(error);
    throw std::forward<E>(error);
}

} // namespace cadence

// =============================================================================
// Logging-Enabled Throw Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error after logging it to global LogService
 * @param error The error to throw
 */
#define CADENCE_THROW_LOG(error) ::cadence::ThrowAndLog((error))

// NOLINTEND(cppcoreguidelines-macro-usage)
