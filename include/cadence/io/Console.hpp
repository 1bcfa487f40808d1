#pragma once

/**
 * @file Console.hpp
 * @brief Console abstraction with ANSI color support
 *
 * Terminal-aware output with ANSI escape codes and tree-drawing characters
 * for model hierarchy reports.
 */

#include <iostream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace cadence {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    Trace,   ///< Most verbose, per-node stage execution
    Debug,   ///< Stage boundaries, aggregation summaries
    Info,    ///< Normal operation
    Event,   ///< Lifecycle milestones (tree defined, system solved)
    Warning, ///< Potential issues
    Error,   ///< Aborted operations
    Fatal    ///< Programming errors
};

// =============================================================================
// AnsiColor
// =============================================================================

/**
 * @brief ANSI color codes
 */
struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Bold = "\033[1m";
    static constexpr const char *Dim = "\033[2m";

    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
    static constexpr const char *Gray = "\033[90m";

    static constexpr const char *BgRed = "\033[41m";
};

// =============================================================================
// TreeChars
// =============================================================================

/**
 * @brief Tree-drawing characters (Unicode)
 */
struct TreeChars {
    static constexpr const char *Branch = "\u251C\u2500\u2500 "; // ├──
    static constexpr const char *Last = "\u2514\u2500\u2500 ";   // └──
    static constexpr const char *Pipe = "\u2502   ";             // │
    static constexpr const char *Blank = "    ";
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Console output with color and formatting support
 *
 * Detects if stdout is a terminal and enables/disables ANSI colors accordingly.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    // === Logging Methods ===

    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }

    /// Log with explicit level
    void Log(LogLevel level, std::string_view msg) {
        if (level < min_level_) {
            return;
        }
        std::cout << Colorize(GetLevelPrefix(level), GetLevelColor(level)) << " " << msg << "\n";
    }

    // === Formatting Helpers ===

    /// Apply color if enabled
    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + AnsiColor::Reset;
    }

    /// Pad string to width (left-aligned text)
    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        if (text.size() >= width) {
            return std::string(text);
        }
        return std::string(text) + std::string(width - text.size(), ' ');
    }

    /// Create horizontal rule
    [[nodiscard]] static std::string HorizontalRule(int width = 80, char c = '-') {
        return std::string(static_cast<std::size_t>(width), c);
    }

    /// Write raw string with newline
    void WriteLine(std::string_view text = "") const { std::cout << text << "\n"; }

    [[nodiscard]] static const char *GetLevelColor(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return AnsiColor::Gray;
        case LogLevel::Debug:
            return AnsiColor::Cyan;
        case LogLevel::Info:
            return AnsiColor::White;
        case LogLevel::Event:
            return AnsiColor::Green;
        case LogLevel::Warning:
            return AnsiColor::Yellow;
        case LogLevel::Error:
            return AnsiColor::Red;
        case LogLevel::Fatal:
            return AnsiColor::BgRed;
        }
        return AnsiColor::White;
    }

    [[nodiscard]] static const char *GetLevelPrefix(LogLevel level) {
        switch (level) {
        case LogLevel::Trace:
            return "[TRC]";
        case LogLevel::Debug:
            return "[DBG]";
        case LogLevel::Info:
            return "[INF]";
        case LogLevel::Event:
            return "[EVT]";
        case LogLevel::Warning:
            return "[WRN]";
        case LogLevel::Error:
            return "[ERR]";
        case LogLevel::Fatal:
            return "[FTL]";
        }
        return "[???]";
    }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

} // namespace cadence
