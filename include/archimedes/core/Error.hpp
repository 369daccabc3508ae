#pragma once

/**
 * @file Error.hpp
 * @brief Exception types for Archimedes
 *
 * One base class and four categories. Context (file, line, time) travels as
 * data on the exception instead of in more subclasses.
 */

#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace archimedes {

enum class Severity : uint8_t {
    INFO,    ///< Informational only
    WARNING, ///< Degraded but usable
    ERROR,   ///< Operation rejected, simulation state intact
    FATAL    ///< Simulation state cannot be trusted
};

/**
 * @brief Base class for every exception Archimedes throws
 *
 * what() is prefixed with "[archimedes] ". The category names the subsystem
 * ("config", "integration", "state", "io") and becomes the log component when
 * the error is logged.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[archimedes] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  private:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// ConfigError
// =============================================================================

/**
 * @brief Invalid construction constants or configuration input
 *
 * Message layout when a source is known:
 *   Config: <message>
 *     at: <file>[:<line>]
 *     hint: <hint>
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg) : ConfigError(msg, "") {}

    ConfigError(const std::string &msg, std::string file, int line = -1, std::string hint = "")
        : Error(Describe(msg, file, line, hint), Severity::ERROR, "config"),
          file_(std::move(file)), line_(line), hint_(std::move(hint)) {}

    /// Source file, empty when the value did not come from a file
    [[nodiscard]] const std::string &file() const { return file_; }
    /// 1-based line, -1 when unknown
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

    /// A physical constant that must be strictly positive and finite
    [[nodiscard]] static ConfigError NotPositive(const std::string &key, double value) {
        std::ostringstream oss;
        oss << "'" << key << "' must be positive and finite, got " << value;
        return ConfigError(oss.str());
    }

  private:
    static std::string Describe(const std::string &msg, const std::string &file, int line,
                                const std::string &hint) {
        std::ostringstream oss;
        oss << "Config: " << msg;
        if (!file.empty()) {
            oss << "\n  at: " << file;
            if (line >= 0) {
                oss << ":" << line;
            }
        }
        if (!hint.empty()) {
            oss << "\n  hint: " << hint;
        }
        return oss.str();
    }

    std::string file_;
    int line_;
    std::string hint_;
};

// =============================================================================
// IntegrationError
// =============================================================================

/**
 * @brief A tick that cannot be taken (bad time delta)
 */
class IntegrationError : public Error {
  public:
    explicit IntegrationError(const std::string &msg)
        : Error("Integration: " + msg, Severity::ERROR, "integration") {}

    IntegrationError(double t, double dt, const std::string &reason)
        : Error(Describe(t, dt, reason), Severity::ERROR, "integration"), t_(t), dt_(dt) {}

    /// Simulation time of the rejected tick
    [[nodiscard]] std::optional<double> t() const { return t_; }
    /// Offending time delta
    [[nodiscard]] std::optional<double> dt() const { return dt_; }

    [[nodiscard]] static IntegrationError NonFiniteStep(double t, double dt) {
        return {t, dt, "elapsed time is not finite"};
    }

    [[nodiscard]] static IntegrationError NegativeStep(double t, double dt) {
        return {t, dt, "elapsed time is negative"};
    }

  private:
    static std::string Describe(double t, double dt, const std::string &reason) {
        std::ostringstream oss;
        oss << "Integration failed at t=" << t << " s, dt=" << dt << " s: " << reason;
        return oss.str();
    }

    std::optional<double> t_;
    std::optional<double> dt_;
};

// =============================================================================
// StateError / IOError
// =============================================================================

/// A state handed to the simulator violates its invariants
class StateError : public Error {
  public:
    explicit StateError(const std::string &msg)
        : Error("State: " + msg, Severity::FATAL, "state") {}
};

/// A file that cannot be read or written
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, std::string path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(std::move(path)) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace archimedes
