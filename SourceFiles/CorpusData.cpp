#include "CorpusData.h"
#include <cstdint>
#include <limits>

MatchRecord MakeErrorRecord(const std::string& filename, const std::string& message)
{
    MatchRecord record;
    record.filename = filename;
    record.error = message;
    return record;
}

// --- Corpus ---

void Corpus::Upsert(MatchRecord record)
{
    auto it = m_index.find(record.filename);
    if (it != m_index.end())
    {
        m_records[it->second] = std::move(record);
    }
    else
    {
        m_index.emplace(record.filename, m_records.size());
        m_records.push_back(std::move(record));
    }
    processed_files = static_cast<int>(m_records.size());
}

const MatchRecord* Corpus::Find(const std::string& filename) const
{
    auto it = m_index.find(filename);
    if (it == m_index.end()) return nullptr;
    return &m_records[it->second];
}

void Corpus::Clear()
{
    m_records.clear();
    m_index.clear();
    total_files = 0;
    processed_files = 0;
}

// --- JSON mapping ---

static StructuredValue OptionalToJson(const std::optional<std::string>& value)
{
    if (value) return *value;
    return nullptr;
}

static std::optional<std::string> OptionalFromJson(const StructuredValue& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

StructuredValue MatchRecordToJson(const MatchRecord& record)
{
    StructuredValue j = StructuredValue::object();
    if (record.error)
    {
        j["error"] = *record.error;
        return j;
    }

    j["match_details"] = StructuredValue::array();
    for (const auto& value : record.match_details)
        j["match_details"].push_back(value);

    j["game_version"] = {
        { "build", OptionalToJson(record.game_version.build) },
        { "branch", OptionalToJson(record.game_version.branch) },
    };

    j["players"] = record.players;

    if (record.map_info)
    {
        j["map_info"] = {
            { "map", record.map_info->map },
            { "mode", record.map_info->mode },
        };
    }
    return j;
}

MatchRecord MatchRecordFromJson(const std::string& filename, const StructuredValue& j)
{
    if (!j.is_object())
        return MakeErrorRecord(filename, "Malformed record");

    if (j.contains("error"))
    {
        const auto& e = j["error"];
        return MakeErrorRecord(filename, e.is_string() ? e.get<std::string>() : e.dump());
    }

    MatchRecord record;
    record.filename = filename;

    if (j.contains("match_details") && j["match_details"].is_array())
    {
        for (const auto& value : j["match_details"])
            record.match_details.push_back(value);
    }

    if (j.contains("game_version") && j["game_version"].is_object())
    {
        const auto& gv = j["game_version"];
        record.game_version.build = OptionalFromJson(gv, "build");
        record.game_version.branch = OptionalFromJson(gv, "branch");
    }

    if (j.contains("players") && j["players"].is_array())
    {
        for (const auto& p : j["players"])
        {
            if (p.is_string())
                record.players.push_back(p.get<std::string>());
        }
    }

    if (j.contains("map_info") && j["map_info"].is_object())
    {
        const auto& mi = j["map_info"];
        MapInfo info;
        info.map = mi.value("map", std::string());
        info.mode = mi.value("mode", std::string());
        record.map_info = std::move(info);
    }

    return record;
}

StructuredValue CorpusToJson(const Corpus& corpus)
{
    StructuredValue j = StructuredValue::object();
    j["total_files"] = corpus.total_files;
    j["processed_files"] = corpus.processed_files;
    j["results"] = StructuredValue::object();

    auto& results = j["results"];
    for (const auto& record : corpus.GetRecords())
        results[record.filename] = MatchRecordToJson(record);

    return j;
}

static bool ReadCount(const StructuredValue& j, const char* key, int& out, std::string& error)
{
    auto it = j.find(key);
    if (it == j.end())
    {
        out = 0;
        return true;
    }
    if (!it->is_number_integer())
    {
        error = std::string("'") + key + "' is not an integer";
        return false;
    }
    // Unsigned values above INT64_MAX would wrap when read as signed.
    const bool inRange = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= 0 && it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange)
    {
        error = std::string("'") + key + "' is out of range";
        return false;
    }
    out = static_cast<int>(it->get<int64_t>());
    return true;
}

bool CorpusFromJson(const StructuredValue& j, Corpus& out, std::string& error)
{
    out.Clear();

    if (!j.is_object())
    {
        error = "document is not an object";
        return false;
    }
    if (!j.contains("results") || !j["results"].is_object())
    {
        error = "missing 'results' object";
        return false;
    }

    int total = 0, processed = 0;
    if (!ReadCount(j, "total_files", total, error)) return false;
    if (!ReadCount(j, "processed_files", processed, error)) return false;

    for (const auto& [filename, value] : j["results"].items())
        out.Upsert(MatchRecordFromJson(filename, value));

    out.total_files = total;
    // Keep the stored count so a report can show what the file claims.
    out.processed_files = processed;
    return true;
}
