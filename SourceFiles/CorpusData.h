#pragma once
#include "SegmentScanner.h"
#include "MetadataExtractor.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct MapInfo
{
    std::string map;
    std::string mode;

    bool operator==(const MapInfo&) const = default;
};

struct MatchRecord
{
    std::string filename;
    std::vector<StructuredValue> match_details;
    BuildInfo game_version;
    std::vector<std::string> players;       // sorted, unique
    std::optional<MapInfo> map_info;

    // Set when the file could not be processed; the other fields are unused.
    std::optional<std::string> error;

    bool IsError() const { return error.has_value(); }
};

MatchRecord MakeErrorRecord(const std::string& filename, const std::string& message);

// One record per replay file, kept in insertion order. Replacing a record
// keeps its original position.
class Corpus
{
public:
    int total_files = 0;
    int processed_files = 0;

    void Upsert(MatchRecord record);
    const MatchRecord* Find(const std::string& filename) const;
    const std::vector<MatchRecord>& GetRecords() const { return m_records; }
    size_t Size() const { return m_records.size(); }
    void Clear();

private:
    std::vector<MatchRecord> m_records;
    std::unordered_map<std::string, size_t> m_index;
};

StructuredValue MatchRecordToJson(const MatchRecord& record);
MatchRecord MatchRecordFromJson(const std::string& filename, const StructuredValue& j);

StructuredValue CorpusToJson(const Corpus& corpus);

// Fails (with a reason) when the document does not have the corpus shape.
// Individual malformed records are kept as error records instead.
bool CorpusFromJson(const StructuredValue& j, Corpus& out, std::string& error);
