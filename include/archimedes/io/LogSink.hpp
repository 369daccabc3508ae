#pragma once

/**
 * @file LogSink.hpp
 * @brief Ready-made LogService sinks
 */

#include <archimedes/core/Error.hpp>
#include <archimedes/io/Console.hpp>
#include <archimedes/io/LogService.hpp>

#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace archimedes::LogSinks {

/// Writes each entry as one line, colored if the console has colors on
inline LogService::Sink ToConsole(const Console &console) {
    return [&console](const std::vector<LogEntry> &entries) {
        for (const auto &entry : entries) {
            console.Line(entry.Format(console));
        }
        console.Flush();
    };
}

/**
 * @brief Appends plain-text entries to a file
 * @throws IOError if the file cannot be opened for writing
 */
inline LogService::Sink ToFile(const std::string &path) {
    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        throw IOError("open", path, "cannot write log file");
    }
    return [file](const std::vector<LogEntry> &entries) {
        for (const auto &entry : entries) {
            *file << entry.Format() << "\n";
        }
        file->flush();
    };
}

/// Accepts and drops everything
inline LogService::Sink Discard() {
    return [](const std::vector<LogEntry> & /*entries*/) {};
}

/// Calls handler once per entry
inline LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
    return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
        for (const auto &entry : entries) {
            handler(entry);
        }
    };
}

} // namespace archimedes::LogSinks
