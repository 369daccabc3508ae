#pragma once

/**
 * @file Console.hpp
 * @brief Terminal output for log lines and tick tables
 *
 * A Console writes to one stream (stdout by default). ANSI colors are only
 * turned on automatically when that stream is an interactive terminal.
 */

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace archimedes {

// =============================================================================
// LogLevel
// =============================================================================

/**
 * @brief Log severity levels, ordered from most to least verbose
 */
enum class LogLevel {
    Trace,   ///< Internal detail
    Debug,   ///< Per-tick diagnostics (height)
    Info,    ///< Lifecycle (construction, run start/end, reset)
    Event,   ///< Physical events (entering or leaving the water)
    Warning, ///< Suspicious but tolerated input
    Error,   ///< Rejected operation
    Fatal    ///< Unrecoverable state
};

/// Three-letter tag printed in every log line
[[nodiscard]] constexpr std::string_view LevelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRC";
    case LogLevel::Debug:
        return "DBG";
    case LogLevel::Info:
        return "INF";
    case LogLevel::Event:
        return "EVT";
    case LogLevel::Warning:
        return "WRN";
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Fatal:
        return "FTL";
    }
    return "???";
}

// =============================================================================
// ANSI escape codes
// =============================================================================

namespace ansi {

inline constexpr const char *kReset = "\033[0m";
inline constexpr const char *kDim = "\033[2m";
inline constexpr const char *kRed = "\033[31m";
inline constexpr const char *kGreen = "\033[32m";
inline constexpr const char *kYellow = "\033[33m";
inline constexpr const char *kCyan = "\033[36m";
inline constexpr const char *kWhite = "\033[37m";
inline constexpr const char *kGray = "\033[90m";
inline constexpr const char *kBgRed = "\033[41m";

/// Color used for a level's tag
[[nodiscard]] constexpr const char *ForLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return kGray;
    case LogLevel::Debug:
        return kCyan;
    case LogLevel::Info:
        return kWhite;
    case LogLevel::Event:
        return kGreen;
    case LogLevel::Warning:
        return kYellow;
    case LogLevel::Error:
        return kRed;
    case LogLevel::Fatal:
        return kBgRed;
    }
    return kWhite;
}

} // namespace ansi

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Level-filtered, optionally colored writer
 *
 * Copies share the underlying stream, which must outlive them.
 */
class Console {
  public:
    /// stdout, colored when stdout is a terminal
    Console() : out_(&std::cout), is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    /// Any stream; never treated as a terminal
    explicit Console(std::ostream &out) : out_(&out) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Messages below this level are dropped by Log()
    void SetLogLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetLogLevel() const { return min_level_; }

    /// "[TAG] message", tag colored when enabled
    void Log(LogLevel level, std::string_view msg) const {
        if (level < min_level_) {
            return;
        }
        const std::string tag = "[" + std::string(LevelTag(level)) + "]";
        *out_ << Colorize(tag, ansi::ForLevel(level)) << " " << msg << "\n";
    }

    void Line(std::string_view text = "") const { *out_ << text << "\n"; }

    void Flush() const { out_->flush(); }

    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        if (!color_enabled_) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + ansi::kReset;
    }

    // === Table helpers ===

    /// Right-aligned column labels
    [[nodiscard]] static std::string Header(const std::vector<std::string> &labels,
                                            int width = 12) {
        std::ostringstream oss;
        for (const auto &label : labels) {
            oss << std::setw(width) << label;
        }
        return oss.str();
    }

    /// Right-aligned fixed-point values
    [[nodiscard]] static std::string Row(const std::vector<double> &values, int width = 12,
                                         int precision = 3) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision);
        for (double v : values) {
            oss << std::setw(width) << v;
        }
        return oss.str();
    }

    [[nodiscard]] static std::string Rule(std::size_t width, char c = '-') {
        return std::string(width, c);
    }

  private:
    std::ostream *out_;
    bool is_tty_ = false;
    bool color_enabled_ = false;
    LogLevel min_level_ = LogLevel::Info;
};

} // namespace archimedes
