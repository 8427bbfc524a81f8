#include "ProgramConfig.h"
#include <cstdint>
#include <fstream>

static bool ReadString(const StructuredValue& j, const char* key, std::string& out, std::string& error)
{
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string())
    {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

static bool ReadCount(const StructuredValue& j, const char* key, int minValue, int& out, std::string& error)
{
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_number_integer() || it->get<int64_t>() < minValue || it->get<int64_t>() > 1000000)
    {
        error = std::string("'") + key + "' must be an integer >= " + std::to_string(minValue);
        return false;
    }
    out = it->get<int>();
    return true;
}

static bool ReadSize(const StructuredValue& j, const char* key, size_t& out, std::string& error)
{
    int value = static_cast<int>(out);
    if (!ReadCount(j, key, 0, value, error)) return false;
    out = static_cast<size_t>(value);
    return true;
}

bool ParseProgramConfig(const StructuredValue& j, ProgramConfig& out, std::string& error)
{
    if (!j.is_object())
    {
        error = "config must be a JSON object";
        return false;
    }

    ProgramConfig cfg = out;
    if (!ReadString(j, "replays_folder", cfg.replays_folder, error)) return false;
    if (!ReadString(j, "replay_extension", cfg.replay_extension, error)) return false;
    if (!ReadString(j, "corpus_path", cfg.corpus_path, error)) return false;
    if (!ReadCount(j, "worker_count", 0, cfg.worker_count, error)) return false;
    if (!ReadCount(j, "flush_interval", 1, cfg.flush_interval, error)) return false;

    std::string level;
    if (!ReadString(j, "log_level", level, error)) return false;
    if (!level.empty() && !ParseLogLevel(level, cfg.log_level))
    {
        error = "unknown log_level '" + level + "'";
        return false;
    }

    auto report = j.find("report");
    if (report != j.end())
    {
        if (!report->is_object())
        {
            error = "'report' must be an object";
            return false;
        }
        if (!ReadSize(*report, "top_active_players", cfg.report.top_active_players, error)) return false;
        if (!ReadSize(*report, "top_win_rate_players", cfg.report.top_win_rate_players, error)) return false;
        if (!ReadCount(*report, "min_qualifying_matches", 1, cfg.report.min_qualifying_matches, error)) return false;
        if (!ReadSize(*report, "top_partnerships", cfg.report.top_partnerships, error)) return false;
    }

    if (cfg.corpus_path.empty())
    {
        error = "'corpus_path' must not be empty";
        return false;
    }

    out = std::move(cfg);
    return true;
}

bool LoadProgramConfig(const std::filesystem::path& path, ProgramConfig& out, std::string& error)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        error = "cannot open config " + path.string();
        return false;
    }

    StructuredValue j = StructuredValue::parse(file, nullptr, false);
    if (j.is_discarded())
    {
        error = "config " + path.string() + " is not valid JSON";
        return false;
    }

    if (!ParseProgramConfig(j, out, error))
    {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}
