#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Report an Error through the LogService before throwing it
 */

#include <archimedes/core/Error.hpp>
#include <archimedes/io/LogService.hpp>

#include <string>
#include <utility>

namespace archimedes {

[[nodiscard]] constexpr LogLevel ToLogLevel(Severity severity) {
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
 * @brief Log an error at the level matching its severity
 *
 * The entry keeps the current thread-local entity and uses @p component, or
 * the error's category when none is given.
 */
inline void LogError(const Error &error, double time, const std::string &component = "") {
    LogContext ctx{LogContextManager::GetContext().entity,
                   component.empty() ? error.category() : component};
    GetLogService().Log(ToLogLevel(error.severity()), time, error.what(), ctx);
}

/**
 * @code
 * ThrowAndLog(IntegrationError::NegativeStep(t, dt), t, "Simulator");
 * @endcode
 */
template <typename E>
[[noreturn]] void ThrowAndLog(E &&error, double time, const std::string &component = "") {
    LogError(error, time, component);
    throw std::forward<E>(error);
}

} // namespace archimedes

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ARCHIMEDES_THROW_LOG(error, time) ::archimedes::ThrowAndLog((error), (time))
#define ARCHIMEDES_THROW_LOG_CTX(error, time, component)                                           \
    ::archimedes::ThrowAndLog((error), (time), (component))
// NOLINTEND(cppcoreguidelines-macro-usage)
