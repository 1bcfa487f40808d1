#pragma once

/**
 * @file LogService.hpp
 * @brief Unified logging service for Cadence
 *
 * Provides both immediate and buffered logging modes. The assembler scopes a
 * thread-local LogContext around every stage method so that messages logged
 * from model code carry the node path and stage without passing them around.
 */

#include <cadence/core/CoreTypes.hpp>
#include <cadence/io/Console.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cadence {

// =============================================================================
// LogContext
// =============================================================================

/**
 * @brief Log context - set by the assembler while a node is being defined
 */
struct LogContext {
    std::string path;  ///< Node tree path (e.g., "bicycle.front_wheel")
    std::string stage; ///< Stage name (e.g., "kinematics")
    std::string type;  ///< Node type (e.g., "KnifeEdgeWheel")

    /// Check if context is set
    [[nodiscard]] bool IsSet() const { return !path.empty(); }
};

// =============================================================================
// LogEntry
// =============================================================================

/**
 * @brief A single log entry with full context
 */
struct LogEntry {
    LogLevel level;      ///< Severity level
    std::string message; ///< Log message
    LogContext context;  ///< Node/stage context

    /// Wall clock time for ordering
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, std::string_view message, const LogContext &ctx) {
        LogEntry entry;
        entry.level = level;
        entry.message = std::string(message);
        entry.context = ctx;
        entry.wall_time = std::chrono::steady_clock::now();
        return entry;
    }

    /// Format for output: "[LEVEL] [path|stage] message"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << Console::GetLevelPrefix(level) << " ";
        if (include_context && context.IsSet()) {
            oss << "[" << ContextLabel() << "] ";
        }
        oss << message;
        return oss.str();
    }

    /// Format with colors (for terminal)
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::ostringstream oss;
        oss << console.Colorize(Console::GetLevelPrefix(level), Console::GetLevelColor(level))
            << " ";
        if (context.IsSet()) {
            oss << console.Colorize("[" + ContextLabel() + "]", AnsiColor::Cyan) << " ";
        }
        oss << message;
        return oss.str();
    }

  private:
    [[nodiscard]] std::string ContextLabel() const {
        if (context.stage.empty()) {
            return context.path;
        }
        return context.path + "|" + context.stage;
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local log context manager
 *
 * The assembler sets this before calling a node's stage method.
 */
class LogContextManager {
  public:
    static void SetContext(const LogContext &ctx) { current_context_ = ctx; }
    static void ClearContext() { current_context_ = LogContext{}; }
    [[nodiscard]] static const LogContext &GetContext() { return current_context_; }

    /**
     * @brief RAII guard for automatic context management
     */
    class ScopedContext {
      public:
        ScopedContext(const std::string &path, const std::string &stage,
                      const std::string &type = "")
            : previous_(current_context_) {
            current_context_.path = path;
            current_context_.stage = stage;
            current_context_.type = type;
        }

        ~ScopedContext() { current_context_ = previous_; }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext previous_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_context_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Unified logging service for Cadence
 *
 * ALL logging goes through this service. It operates in two modes:
 *
 * 1. **Immediate mode** (default): entries are handed to the sinks as soon
 *    as they are logged.
 * 2. **Buffered mode**: entries are collected and flushed on demand, e.g.
 *    around a full DefineAll() when the caller wants one consolidated report.
 */
class LogService {
  public:
    /// Sink callback type: receives batch of entries to output
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    LogService() = default;

    // === Mode Control ===

    void SetImmediateMode(bool immediate) { immediate_mode_ = immediate; }
    [[nodiscard]] bool IsImmediateMode() const { return immediate_mode_; }

    /**
     * @brief RAII guard for buffered mode
     *
     * Switches to buffered mode on construction, restores previous mode
     * and flushes on destruction.
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), previous_mode_(service.immediate_mode_) {
            service_.SetImmediateMode(false);
        }

        ~BufferedScope() {
            service_.FlushAndClear();
            service_.SetImmediateMode(previous_mode_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool previous_mode_;
    };

    // === Configuration ===

    /// Set minimum level (below this = dropped)
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    void AddSink(Sink sink) { sinks_.emplace_back(std::move(sink), LogLevel::Trace); }

    /// Add a sink that only receives entries at or above a level
    void AddSink(Sink sink, LogLevel min_level) { sinks_.emplace_back(std::move(sink), min_level); }

    void ClearSinks() { sinks_.clear(); }

    // === Logging API ===

    /// Log a message (uses current thread-local context)
    void Log(LogLevel level, std::string_view message) {
        Log(level, message, LogContextManager::GetContext());
    }

    /// Log with explicit context (bypasses thread-local)
    void Log(LogLevel level, std::string_view message, const LogContext &ctx) {
        if (level < min_level_) {
            return;
        }

        auto entry = LogEntry::Create(level, message, ctx);

        std::lock_guard<std::mutex> lock(mutex_);

        if (level == LogLevel::Error) {
            ++error_count_;
        } else if (level == LogLevel::Fatal) {
            ++fatal_count_;
        }

        entries_.push_back(std::move(entry));

        if (immediate_mode_) {
            FlushEntry(entries_.back());
            entries_.pop_back();
        }
    }

    void Trace(std::string_view msg) { Log(LogLevel::Trace, msg); }
    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }
    void Fatal(std::string_view msg) { Log(LogLevel::Fatal, msg); }

    // === Flush Control ===

    /// Flush buffer to all sinks
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (entries_.empty()) {
            return;
        }

        for (const auto &[sink, min_level] : sinks_) {
            std::vector<LogEntry> filtered;
            filtered.reserve(entries_.size());
            for (const auto &entry : entries_) {
                if (entry.level >= min_level) {
                    filtered.push_back(entry);
                }
            }
            if (!filtered.empty()) {
                sink(filtered);
            }
        }
    }

    void FlushAndClear() {
        Flush();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    /// Clear buffer without flushing (discard pending logs)
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // === Query API ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }

    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }

    [[nodiscard]] bool HasErrors() const { return ErrorCount() > 0; }

    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = 0;
        fatal_count_ = 0;
    }

    /// Pending entries logged while defining a given node
    [[nodiscard]] std::vector<LogEntry> GetEntriesForNode(std::string_view path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> result;
        for (const auto &entry : entries_) {
            if (entry.context.path == path) {
                result.push_back(entry);
            }
        }
        return result;
    }

  private:
    std::vector<LogEntry> entries_;
    std::vector<std::pair<Sink, LogLevel>> sinks_; ///< sink + min level
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_mode_ = true;

    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;

    mutable std::mutex mutex_;

    void FlushEntry(const LogEntry &entry) {
        for (const auto &[sink, min_level] : sinks_) {
            if (entry.level >= min_level) {
                sink({entry});
            }
        }
    }
};

/**
 * @brief Global log service singleton
 */
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

/**
 * @brief Sink that prints entries to a console (colored when it is a terminal)
 */
inline LogService::Sink MakeConsoleSink(Console console = Console{}) {
    return [console](const std::vector<LogEntry> &entries) {
        for (const auto &entry : entries) {
            console.WriteLine(entry.FormatColored(console));
        }
    };
}

} // namespace cadence

// =============================================================================
// Logging Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CADENCE_LOG_TRACE(msg) ::cadence::GetLogService().Trace(msg)

#define CADENCE_LOG_DEBUG(msg) ::cadence::GetLogService().Debug(msg)

#define CADENCE_LOG_INFO(msg) ::cadence::GetLogService().Info(msg)

#define CADENCE_LOG_EVENT(msg) ::cadence::GetLogService().Event(msg)

#define CADENCE_LOG_WARN(msg) ::cadence::GetLogService().Warning(msg)

#define CADENCE_LOG_ERROR(msg) ::cadence::GetLogService().Error(msg)

#define CADENCE_LOG_FATAL(msg) ::cadence::GetLogService().Fatal(msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
