/**
 * @file TestProgramConfig.cpp
 * @brief Unit tests for the config file reader and the log facade.
 */

#include <catch2/catch_test_macros.hpp>

#include "DebugLog.h"
#include "ProgramConfig.h"
#include "TestHelpers.h"

#include <mutex>

namespace {

class CaptureSink : public ILogSink
{
public:
    void Write(LogLevel level, const std::string& tag, const std::string& message) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(std::string(LogLevelName(level)) + "|" + tag + "|" + message);
    }

    std::mutex mutex;
    std::vector<std::string> lines;
};

} // namespace

TEST_CASE("ParseProgramConfig applies present keys", "[config]")
{
    StructuredValue j = {
        { "replays_folder", "/data/replays" },
        { "replay_extension", ".bin" },
        { "worker_count", 3 },
        { "flush_interval", 10 },
        { "log_level", "WARNING" },
        { "report", { { "top_active_players", 20 }, { "min_qualifying_matches", 5 } } },
    };

    ProgramConfig cfg;
    std::string error;
    REQUIRE(ParseProgramConfig(j, cfg, error));
    REQUIRE(cfg.replays_folder == "/data/replays");
    REQUIRE(cfg.replay_extension == ".bin");
    REQUIRE(cfg.corpus_path == "replays_output.json");
    REQUIRE(cfg.worker_count == 3);
    REQUIRE(cfg.flush_interval == 10);
    REQUIRE(cfg.log_level == LogLevel::Warning);
    REQUIRE(cfg.report.top_active_players == 20);
    REQUIRE(cfg.report.top_win_rate_players == 5);
    REQUIRE(cfg.report.min_qualifying_matches == 5);
}

TEST_CASE("ParseProgramConfig rejects bad values", "[config]")
{
    ProgramConfig cfg;
    std::string error;

    SECTION("not an object")
    {
        REQUIRE_FALSE(ParseProgramConfig(StructuredValue::array(), cfg, error));
    }

    SECTION("wrong type")
    {
        REQUIRE_FALSE(ParseProgramConfig(StructuredValue{ { "worker_count", "many" } }, cfg, error));
        REQUIRE(error.find("worker_count") != std::string::npos);
    }

    SECTION("out of range")
    {
        REQUIRE_FALSE(ParseProgramConfig(StructuredValue{ { "flush_interval", 0 } }, cfg, error));
    }

    SECTION("unknown log level")
    {
        REQUIRE_FALSE(ParseProgramConfig(StructuredValue{ { "log_level", "loud" } }, cfg, error));
    }

    SECTION("failed parse leaves the config untouched")
    {
        StructuredValue j = { { "replays_folder", "/x" }, { "worker_count", -1 } };
        REQUIRE_FALSE(ParseProgramConfig(j, cfg, error));
        REQUIRE(cfg.replays_folder.empty());
    }
}

TEST_CASE("LoadProgramConfig reads a file", "[config]")
{
    test::TempDir dir;
    ProgramConfig cfg;
    std::string error;

    dir.Write("ok.json", std::string("{\"corpus_path\": \"out/corpus.json\"}"));
    REQUIRE(LoadProgramConfig(dir.path() / "ok.json", cfg, error));
    REQUIRE(cfg.corpus_path == "out/corpus.json");

    dir.Write("broken.json", std::string("{\"corpus_path\": "));
    REQUIRE_FALSE(LoadProgramConfig(dir.path() / "broken.json", cfg, error));
    REQUIRE_FALSE(LoadProgramConfig(dir.path() / "absent.json", cfg, error));
}

TEST_CASE("DebugLog filters by level and routes to the sink", "[log]")
{
    auto sink = std::make_shared<CaptureSink>();
    DebugLog::SetSink(sink);
    DebugLog::SetMinLevel(LogLevel::Info);

    DebugLog::Debug("t", "hidden");
    DebugLog::Info("t", "shown");
    DebugLog::Error("store", "failed");

    DebugLog::SetSink(nullptr);

    REQUIRE(sink->lines == std::vector<std::string>{ "info|t|shown", "error|store|failed" });

    LogLevel level = LogLevel::Error;
    REQUIRE(ParseLogLevel("Debug", level));
    REQUIRE(level == LogLevel::Debug);
    REQUIRE(ParseLogLevel("warn", level));
    REQUIRE(level == LogLevel::Warning);
    REQUIRE_FALSE(ParseLogLevel("verbose", level));
}
