#pragma once
#include "DebugLog.h"
#include "StatisticsAnalyzer.h"
#include <filesystem>
#include <string>

struct ProgramConfig
{
    std::string replays_folder;
    std::string replay_extension = ".replay";
    std::string corpus_path = "replays_output.json";
    int worker_count = 0;        // 0 = hardware concurrency
    int flush_interval = 1;
    LogLevel log_level = LogLevel::Info;
    AnalyzerOptions report;
};

inline constexpr const char* kDefaultConfigFile = "replay_corpus.json";

// Reads a JSON config document. Missing keys keep their defaults; a key of
// the wrong type or out of range is an error.
bool ParseProgramConfig(const StructuredValue& j, ProgramConfig& out, std::string& error);

bool LoadProgramConfig(const std::filesystem::path& path, ProgramConfig& out, std::string& error);
