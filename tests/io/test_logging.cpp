/**
 * @file test_logging.cpp
 * @brief Unit tests for Console, LogService and log sinks
 */

#include <archimedes/io/Console.hpp>
#include <archimedes/io/LogService.hpp>
#include <archimedes/io/LogSink.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace archimedes;

// =============================================================================
// Console Tests
// =============================================================================

TEST(Console, StdoutColorFollowsTerminal) {
    Console console;
    EXPECT_EQ(console.IsColorEnabled(), console.IsTerminal());
}

TEST(Console, StreamConsoleIsPlain) {
    std::ostringstream out;
    Console console(out);
    EXPECT_FALSE(console.IsTerminal());
    EXPECT_FALSE(console.IsColorEnabled());
}

TEST(Console, Colorize) {
    std::ostringstream out;
    Console console(out);
    EXPECT_EQ(console.Colorize("height", ansi::kRed), "height");

    console.SetColorEnabled(true);
    auto result = console.Colorize("height", ansi::kRed);
    EXPECT_EQ(result, std::string("\033[31m") + "height" + "\033[0m");
}

TEST(Console, LogFiltersByLevel) {
    std::ostringstream out;
    Console console(out);
    EXPECT_EQ(console.GetLogLevel(), LogLevel::Info);
    console.SetLogLevel(LogLevel::Warning);
    EXPECT_EQ(console.GetLogLevel(), LogLevel::Warning);

    console.Log(LogLevel::Info, "dropped");
    console.Log(LogLevel::Warning, "kept");

    EXPECT_EQ(out.str(), "[WRN] kept\n");
}

TEST(Console, LogColorsTagOnly) {
    std::ostringstream out;
    Console console(out);
    console.SetColorEnabled(true);

    console.Log(LogLevel::Event, "splash");
    EXPECT_EQ(out.str(), std::string(ansi::kGreen) + "[EVT]" + ansi::kReset + " splash\n");
}

TEST(Console, TableHelpers) {
    EXPECT_EQ(Console::Header({"t", "z"}, 4), "   t   z");
    EXPECT_EQ(Console::Row({0.5, -8.81}, 8, 2), "    0.50   -8.81");
    EXPECT_EQ(Console::Rule(5), "-----");
    EXPECT_EQ(Console::Rule(3, '='), "===");
}

TEST(Console, LevelTags) {
    EXPECT_EQ(LevelTag(LogLevel::Trace), "TRC");
    EXPECT_EQ(LevelTag(LogLevel::Debug), "DBG");
    EXPECT_EQ(LevelTag(LogLevel::Info), "INF");
    EXPECT_EQ(LevelTag(LogLevel::Event), "EVT");
    EXPECT_EQ(LevelTag(LogLevel::Warning), "WRN");
    EXPECT_EQ(LevelTag(LogLevel::Error), "ERR");
    EXPECT_EQ(LevelTag(LogLevel::Fatal), "FTL");
}

// =============================================================================
// LogConfig Tests
// =============================================================================

TEST(LogConfig, Presets) {
    auto def = LogConfig::Default();
    EXPECT_EQ(def.console_level, LogLevel::Info);
    EXPECT_FALSE(def.file_enabled);
    EXPECT_FALSE(def.quiet_mode);

    auto quiet = LogConfig::Quiet();
    EXPECT_EQ(quiet.console_level, LogLevel::Error);
    EXPECT_TRUE(quiet.quiet_mode);

    auto verbose = LogConfig::Verbose();
    EXPECT_EQ(verbose.console_level, LogLevel::Trace);
}

TEST(LogConfig, MinLevelConsidersFileOnlyWhenEnabled) {
    LogConfig cfg;
    cfg.console_level = LogLevel::Warning;
    cfg.file_level = LogLevel::Debug;
    EXPECT_EQ(cfg.MinLevel(), LogLevel::Warning);

    cfg.file_enabled = true;
    cfg.file_path = "run.log";
    EXPECT_EQ(cfg.MinLevel(), LogLevel::Debug);

    cfg.file_level = LogLevel::Fatal;
    EXPECT_EQ(cfg.MinLevel(), LogLevel::Warning);
}

// =============================================================================
// LogEntry / LogContext Tests
// =============================================================================

TEST(LogEntry, Create) {
    LogContext ctx{"sphere", "buoyancy"};
    auto entry = LogEntry::Create(LogLevel::Warning, 1.5, "Deep dive", ctx);

    EXPECT_EQ(entry.level, LogLevel::Warning);
    EXPECT_EQ(entry.sim_time, 1.5);
    EXPECT_EQ(entry.message, "Deep dive");
    EXPECT_EQ(entry.context.FullPath(), "sphere.buoyancy");
}

TEST(LogEntry, Format) {
    auto entry =
        LogEntry::Create(LogLevel::Debug, 0.25, "height=0.975475", LogContext{"sphere", "buoyancy"});
    EXPECT_EQ(entry.Format(), "[0.250] [DBG] [sphere.buoyancy] height=0.975475");
    EXPECT_EQ(entry.Format(false), "[0.250] [DBG] height=0.975475");
}

TEST(LogEntry, FormatWithoutContext) {
    auto entry = LogEntry::Create(LogLevel::Info, 0.0, "Simulator reset", LogContext{});
    EXPECT_EQ(entry.Format(), "[0.000] [INF] Simulator reset");
}

TEST(LogEntry, ConsoleFormatWithoutColorMatchesPlain) {
    std::ostringstream out;
    Console console(out);

    auto entry = LogEntry::Create(LogLevel::Event, 2.0, "Sphere entered the water",
                                  LogContext{"", "buoyancy"});
    EXPECT_EQ(entry.Format(console), entry.Format());
}

TEST(LogContext, FullPathAndIsSet) {
    LogContext ctx;
    EXPECT_FALSE(ctx.IsSet());

    ctx.component = "buoyancy";
    EXPECT_TRUE(ctx.IsSet());
    EXPECT_EQ(ctx.FullPath(), "buoyancy");

    ctx.entity = "sphere";
    EXPECT_EQ(ctx.FullPath(), "sphere.buoyancy");
}

// =============================================================================
// LogContextManager Tests
// =============================================================================

TEST(LogContextManager, NestedScopedContext) {
    EXPECT_FALSE(LogContextManager::GetContext().IsSet());
    {
        LogContextManager::ScopedContext outer("sphere", "buoyancy");
        EXPECT_EQ(LogContextManager::GetContext().component, "buoyancy");

        {
            LogContextManager::ScopedContext inner("pool", "water");
            EXPECT_EQ(LogContextManager::GetContext().entity, "pool");
        }

        EXPECT_EQ(LogContextManager::GetContext().entity, "sphere");
    }
    EXPECT_FALSE(LogContextManager::GetContext().IsSet());
}

TEST(LogContextManager, ContextIsThreadLocal) {
    LogContextManager::ScopedContext scope("sphere", "buoyancy");

    bool other_thread_set = true;
    std::thread worker([&] { other_thread_set = LogContextManager::GetContext().IsSet(); });
    worker.join();

    EXPECT_FALSE(other_thread_set);
    EXPECT_TRUE(LogContextManager::GetContext().IsSet());
}

// =============================================================================
// LogService Tests
// =============================================================================

TEST(LogService, Defaults) {
    LogService service;
    EXPECT_FALSE(service.IsBuffering());
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Info);
    EXPECT_EQ(service.SinkCount(), 0u);
    EXPECT_TRUE(service.Enabled(LogLevel::Info));
    EXPECT_FALSE(service.Enabled(LogLevel::Debug));
}

TEST(LogService, DeliversEachEntryImmediately) {
    LogService service;

    std::size_t batches = 0;
    service.AddSink([&batches](const std::vector<LogEntry> &entries) {
        EXPECT_EQ(entries.size(), 1u);
        ++batches;
    });

    service.Info(0.0, "one");
    service.Info(0.1, "two");

    EXPECT_EQ(batches, 2u);
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST(LogService, MinLevelDropsEntries) {
    LogService service;
    service.SetMinLevel(LogLevel::Warning);
    service.SetBuffering(true);

    service.Info(0.0, "filtered");
    EXPECT_EQ(service.PendingCount(), 0u);
    EXPECT_EQ(service.Count(LogLevel::Info), 0u);

    service.Warning(0.0, "kept");
    EXPECT_EQ(service.PendingCount(), 1u);

    service.Discard();
    EXPECT_EQ(service.PendingCount(), 0u);
}

TEST(LogService, PerSinkLevel) {
    LogService service;
    service.SetMinLevel(LogLevel::Trace);

    std::vector<LogEntry> all;
    std::vector<LogEntry> events;
    service.AddSink(LogSinks::Callback([&all](const LogEntry &e) { all.push_back(e); }));
    service.AddSink(LogSinks::Callback([&events](const LogEntry &e) { events.push_back(e); }),
                    LogLevel::Event);

    service.Debug(0.0, "height=1.000000");
    service.Event(0.5, "Sphere entered the water");

    EXPECT_EQ(all.size(), 2u);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].message, "Sphere entered the water");
}

TEST(LogService, Counters) {
    LogService service;
    service.SetBuffering(true);

    EXPECT_FALSE(service.HasErrors());

    service.Info(0.0, "ready");
    service.Error(0.0, "bad step");
    EXPECT_TRUE(service.HasErrors());
    EXPECT_EQ(service.Count(LogLevel::Info), 1u);
    EXPECT_EQ(service.ErrorCount(), 1u);

    service.Fatal(0.0, "corrupt state");
    EXPECT_EQ(service.FatalCount(), 1u);

    service.ResetCounts();
    EXPECT_FALSE(service.HasErrors());
    EXPECT_EQ(service.Count(LogLevel::Info), 0u);

    service.Discard();
}

TEST(LogService, BufferedScopeFlushesOneBatch) {
    LogService service;

    std::vector<std::size_t> batch_sizes;
    service.AddSink([&batch_sizes](const std::vector<LogEntry> &entries) {
        batch_sizes.push_back(entries.size());
    });

    {
        LogService::BufferedScope scope(service);
        EXPECT_TRUE(service.IsBuffering());

        service.Info(0.0, "a");
        service.Info(0.1, "b");
        service.Info(0.2, "c");
        EXPECT_EQ(service.PendingCount(), 3u);
        EXPECT_TRUE(batch_sizes.empty());
    }

    EXPECT_FALSE(service.IsBuffering());
    EXPECT_EQ(service.PendingCount(), 0u);
    ASSERT_EQ(batch_sizes.size(), 1u);
    EXPECT_EQ(batch_sizes[0], 3u);
}

TEST(LogService, NestedBufferedScopeKeepsOuterBuffering) {
    LogService service;
    {
        LogService::BufferedScope outer(service);
        {
            LogService::BufferedScope inner(service);
        }
        EXPECT_TRUE(service.IsBuffering());
    }
    EXPECT_FALSE(service.IsBuffering());
}

TEST(LogService, UsesThreadLocalContext) {
    LogService service;
    service.SetBuffering(true);

    {
        LogContextManager::ScopedContext scope("sphere", "buoyancy");
        service.Info(0.0, "inside");
    }
    service.Info(0.0, "outside");

    auto pending = service.GetPending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].context.FullPath(), "sphere.buoyancy");
    EXPECT_FALSE(pending[1].context.IsSet());

    service.Discard();
}

TEST(LogService, ClearSinks) {
    LogService service;
    service.AddSink(LogSinks::Discard());
    service.AddSink(LogSinks::Discard());
    EXPECT_EQ(service.SinkCount(), 2u);

    service.ClearSinks();
    EXPECT_EQ(service.SinkCount(), 0u);
}

TEST(LogService, GlobalInstance) { EXPECT_EQ(&GetLogService(), &GetLogService()); }

// =============================================================================
// LogSinks Tests
// =============================================================================

TEST(LogSinks, ToConsoleWritesPlainLines) {
    std::ostringstream out;
    Console console(out);

    LogService service;
    service.AddSink(LogSinks::ToConsole(console));
    service.Event(3.0, "Sphere left the water");

    EXPECT_EQ(out.str(), "[3.000] [EVT] Sphere left the water\n");
}

TEST(LogSinks, ToFileAppendsEntries) {
    auto path = std::filesystem::temp_directory_path() / "archimedes_log_sink_test.log";
    std::filesystem::remove(path);

    {
        LogService service;
        service.AddSink(LogSinks::ToFile(path.string()));
        service.Info(1.0, "Simulator ready");
        service.Warning(2.0, "Low gravity");
    }

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream content;
    content << in.rdbuf();

    EXPECT_NE(content.str().find("[1.000] [INF] Simulator ready"), std::string::npos);
    EXPECT_NE(content.str().find("[2.000] [WRN] Low gravity"), std::string::npos);

    in.close();
    std::filesystem::remove(path);
}

TEST(LogSinks, ToFileRejectsUnwritablePath) {
    EXPECT_THROW(LogSinks::ToFile("/nonexistent/dir/run.log"), IOError);
}
