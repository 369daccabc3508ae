#pragma once

/**
 * @file LogService.hpp
 * @brief Process-wide log service with per-sink filtering
 *
 * Entries are delivered to sinks as soon as they are logged, except inside a
 * BufferedScope where they are held and delivered as one batch when the scope
 * closes. Simulator::Run buffers the whole tick loop this way.
 */

#include <archimedes/core/CoreTypes.hpp>
#include <archimedes/io/Console.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace archimedes {

// =============================================================================
// LogConfig
// =============================================================================

/**
 * @brief Where log output goes and how verbose it is
 */
struct LogConfig {
    LogLevel console_level = LogLevel::Info;

    bool file_enabled = false;
    std::string file_path;
    LogLevel file_level = LogLevel::Debug;

    bool quiet_mode = false; ///< Console shows errors only

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.console_level = LogLevel::Error;
        config.quiet_mode = true;
        return config;
    }

    /// Every tick's height on the console
    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Trace;
        config.file_level = LogLevel::Trace;
        return config;
    }

    /// Lowest level any enabled output accepts
    [[nodiscard]] LogLevel MinLevel() const {
        if (file_enabled && file_level < console_level) {
            return file_level;
        }
        return console_level;
    }
};

// =============================================================================
// LogContext / LogEntry
// =============================================================================

/**
 * @brief Which part of the simulation produced an entry
 */
struct LogContext {
    std::string entity;    ///< e.g. "sphere"
    std::string component; ///< e.g. "buoyancy"

    /// "entity.component", or "component" alone
    [[nodiscard]] std::string FullPath() const { return MakeFullPath(entity, component); }

    [[nodiscard]] bool IsSet() const { return !component.empty(); }
};

struct LogEntry {
    LogLevel level = LogLevel::Info;
    double sim_time = 0.0; ///< Simulation time [s]
    std::string message;
    LogContext context;
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, double sim_time, std::string_view message,
                           const LogContext &ctx) {
        return LogEntry{level, sim_time, std::string(message), ctx,
                        std::chrono::steady_clock::now()};
    }

    /// "[1.250] [EVT] [sphere.buoyancy] Sphere entered the water"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::ostringstream oss;
        oss << "[" << std::fixed << std::setprecision(3) << sim_time << "] [" << LevelTag(level)
            << "] ";
        if (include_context && context.IsSet()) {
            oss << "[" << context.FullPath() << "] ";
        }
        oss << message;
        return oss.str();
    }

    /// Same layout as Format(), colored through the console
    [[nodiscard]] std::string Format(const Console &console) const {
        std::ostringstream time;
        time << std::fixed << std::setprecision(3) << sim_time;

        std::string line = console.Colorize("[" + time.str() + "]", ansi::kDim) + " ";
        line += console.Colorize("[" + std::string(LevelTag(level)) + "]", ansi::ForLevel(level));
        line += " ";
        if (context.IsSet()) {
            line += console.Colorize("[" + context.FullPath() + "]", ansi::kCyan) + " ";
        }
        return line + message;
    }
};

// =============================================================================
// LogContextManager
// =============================================================================

/**
 * @brief Thread-local context picked up by LogService::Log
 *
 * Simulator::Step installs "sphere.buoyancy" for the duration of a tick.
 */
class LogContextManager {
  public:
    [[nodiscard]] static const LogContext &GetContext() { return current_; }

    /// Installs a context and restores the previous one on destruction
    class ScopedContext {
      public:
        ScopedContext(std::string entity, std::string component) : saved_(current_) {
            current_ = LogContext{std::move(entity), std::move(component)};
        }

        ~ScopedContext() { current_ = std::move(saved_); }

        ScopedContext(const ScopedContext &) = delete;
        ScopedContext &operator=(const ScopedContext &) = delete;
        ScopedContext(ScopedContext &&) = delete;
        ScopedContext &operator=(ScopedContext &&) = delete;

      private:
        LogContext saved_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_;
};

// =============================================================================
// LogService
// =============================================================================

class LogService {
  public:
    /// Receives a batch of entries already filtered to the sink's level
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    /**
     * @brief Holds entries for the lifetime of the scope, then flushes
     */
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), was_buffering_(service.IsBuffering()) {
            service_.SetBuffering(true);
        }

        ~BufferedScope() {
            service_.Flush();
            service_.SetBuffering(was_buffering_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool was_buffering_;
    };

    // === Configuration ===

    void SetBuffering(bool buffering) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffering_ = buffering;
    }

    [[nodiscard]] bool IsBuffering() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffering_;
    }

    /// Entries below this level are dropped before reaching any sink
    void SetMinLevel(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel GetMinLevel() const { return min_level_; }

    /// Cheap check for callers that format expensive messages
    [[nodiscard]] bool Enabled(LogLevel level) const { return level >= min_level_; }

    void AddSink(Sink sink, LogLevel min_level = LogLevel::Trace) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(SinkSlot{std::move(sink), min_level});
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    [[nodiscard]] std::size_t SinkCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }

    // === Logging ===

    void Log(LogLevel level, double sim_time, std::string_view message) {
        Log(level, sim_time, message, LogContextManager::GetContext());
    }

    void Log(LogLevel level, double sim_time, std::string_view message, const LogContext &ctx) {
        if (!Enabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[static_cast<std::size_t>(level)];

        if (buffering_) {
            pending_.push_back(LogEntry::Create(level, sim_time, message, ctx));
        } else {
            Dispatch({LogEntry::Create(level, sim_time, message, ctx)});
        }
    }

    void Trace(double t, std::string_view msg) { Log(LogLevel::Trace, t, msg); }
    void Debug(double t, std::string_view msg) { Log(LogLevel::Debug, t, msg); }
    void Info(double t, std::string_view msg) { Log(LogLevel::Info, t, msg); }
    void Event(double t, std::string_view msg) { Log(LogLevel::Event, t, msg); }
    void Warning(double t, std::string_view msg) { Log(LogLevel::Warning, t, msg); }
    void Error(double t, std::string_view msg) { Log(LogLevel::Error, t, msg); }
    void Fatal(double t, std::string_view msg) { Log(LogLevel::Fatal, t, msg); }

    // === Buffer ===

    /// Deliver held entries to the sinks and empty the buffer
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_.empty()) {
            Dispatch(pending_);
            pending_.clear();
        }
    }

    /// Drop held entries without delivering them
    void Discard() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
    }

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    [[nodiscard]] std::vector<LogEntry> GetPending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_;
    }

    // === Counters ===

    /// Entries accepted at exactly this level since the last reset
    [[nodiscard]] std::size_t Count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counts_[static_cast<std::size_t>(level)];
    }

    [[nodiscard]] std::size_t ErrorCount() const { return Count(LogLevel::Error); }
    [[nodiscard]] std::size_t FatalCount() const { return Count(LogLevel::Fatal); }
    [[nodiscard]] bool HasErrors() const { return ErrorCount() + FatalCount() > 0; }

    void ResetCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        counts_.fill(0);
    }

  private:
    static constexpr std::size_t kLevelCount = static_cast<std::size_t>(LogLevel::Fatal) + 1;

    struct SinkSlot {
        Sink sink;
        LogLevel min_level;
    };

    // Caller holds mutex_
    void Dispatch(const std::vector<LogEntry> &entries) const {
        for (const auto &slot : sinks_) {
            std::vector<LogEntry> accepted;
            for (const auto &entry : entries) {
                if (entry.level >= slot.min_level) {
                    accepted.push_back(entry);
                }
            }
            if (!accepted.empty()) {
                slot.sink(accepted);
            }
        }
    }

    std::vector<SinkSlot> sinks_;
    std::vector<LogEntry> pending_;
    std::array<std::size_t, kLevelCount> counts_{};
    LogLevel min_level_ = LogLevel::Info;
    bool buffering_ = false;

    mutable std::mutex mutex_;
};

/// The service every ARCHIMEDES_LOG_* macro writes to
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace archimedes

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ARCHIMEDES_LOG_DEBUG(sim_time, msg) ::archimedes::GetLogService().Debug(sim_time, msg)
#define ARCHIMEDES_LOG_INFO(sim_time, msg) ::archimedes::GetLogService().Info(sim_time, msg)
#define ARCHIMEDES_LOG_EVENT(sim_time, msg) ::archimedes::GetLogService().Event(sim_time, msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
