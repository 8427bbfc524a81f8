#include "StatisticsAnalyzer.h"
#include "FilenameInfo.h"
#include <algorithm>
#include <cstdint>
#include <set>
#include <tuple>
#include <unordered_map>

static const std::string kUnknown = "Unknown";

const char* MatchResultName(MatchResult result)
{
    switch (result)
    {
    case MatchResult::Win:  return "Win";
    case MatchResult::Loss: return "Loose";
    default:                return "Unknown";
    }
}

static const StructuredValue* FindEndGameType(const StructuredValue& segment)
{
    if (!segment.is_object()) return nullptr;

    auto details = segment.find("details");
    if (details != segment.end() && details->is_object())
    {
        auto it = details->find("m_endGameType");
        if (it != details->end() && it->is_string())
            return &*it;
    }

    auto it = segment.find("m_endGameType");
    if (it != segment.end() && it->is_string())
        return &*it;

    return nullptr;
}

MatchResult GetMatchResult(const MatchRecord& record)
{
    if (record.IsError() || record.match_details.empty())
        return MatchResult::Unknown;

    const StructuredValue* endGame = FindEndGameType(record.match_details.front());
    if (!endGame) return MatchResult::Unknown;

    const std::string& value = endGame->get_ref<const std::string&>();
    if (value == "Win") return MatchResult::Win;
    if (value == "Loose") return MatchResult::Loss;
    return MatchResult::Unknown;
}

double SafeRatio(int num, int den)
{
    if (den <= 0) return 0.0;
    return static_cast<double>(num) / static_cast<double>(den);
}

void ResultTally::Add(MatchResult result)
{
    switch (result)
    {
    case MatchResult::Win:  wins++;    break;
    case MatchResult::Loss: losses++;  break;
    default:                unknown++; break;
    }
}

// Players of a record, deduplicated, in ascending order.
static std::vector<std::string> UniquePlayers(const MatchRecord& record)
{
    std::set<std::string> unique(record.players.begin(), record.players.end());
    return std::vector<std::string>(unique.begin(), unique.end());
}

static MapInfo ResolveMapInfo(const MatchRecord& record)
{
    if (record.map_info)
        return *record.map_info;

    FilenameInfo info = ParseReplayFilename(record.filename);
    if (info.has_map)
        return MapInfo{ info.map, info.mode };

    return MapInfo{ kUnknown, kUnknown };
}

PartnershipCounts CountPartnerships(const Corpus& corpus)
{
    PartnershipCounts counts;
    for (const auto& record : corpus.GetRecords())
    {
        if (record.IsError()) continue;
        const auto players = UniquePlayers(record);
        for (size_t i = 0; i < players.size(); i++)
            for (size_t j = i + 1; j < players.size(); j++)
                counts[{ players[i], players[j] }]++;
    }
    return counts;
}

std::vector<const MatchRecord*> OrderChronologically(const Corpus& corpus)
{
    struct Keyed
    {
        const MatchRecord* record;
        bool dated;
        std::tuple<int, int, int, int, int, int> when;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(corpus.Size());
    for (const auto& record : corpus.GetRecords())
    {
        FilenameInfo info = ParseReplayFilename(record.filename);
        Keyed k{ &record, info.has_date, {} };
        if (info.has_date)
            k.when = { info.year, info.month, info.day, info.hour, info.minute, info.second };
        keyed.push_back(k);
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b)
    {
        if (a.dated != b.dated) return a.dated;
        if (!a.dated) return false;
        return a.when < b.when;
    });

    std::vector<const MatchRecord*> ordered;
    ordered.reserve(keyed.size());
    for (const auto& k : keyed)
        ordered.push_back(k.record);
    return ordered;
}

StreakStats ComputeStreaks(const std::vector<MatchResult>& ordered)
{
    StreakStats stats;
    int current = 0;
    for (MatchResult result : ordered)
    {
        if (result == MatchResult::Win)
        {
            current = current >= 0 ? current + 1 : 1;
            stats.max_win_streak = std::max(stats.max_win_streak, current);
        }
        else if (result == MatchResult::Loss)
        {
            current = current <= 0 ? current - 1 : -1;
            stats.max_loss_streak = std::max(stats.max_loss_streak, -current);
        }
        else
        {
            current = 0;
        }
    }
    stats.final_streak = current;
    return stats;
}

// --- Report sections ---

static void AnalyzeMaps(const Corpus& corpus, StatisticsReport& report)
{
    std::unordered_map<std::string, size_t> index;
    for (const auto& record : corpus.GetRecords())
    {
        MapInfo info = ResolveMapInfo(record);
        MapModeStats entry;
        entry.map = info.map;
        entry.mode = info.mode;
        const std::string key = entry.Key();

        auto it = index.find(key);
        if (it == index.end())
        {
            it = index.emplace(key, report.maps.size()).first;
            report.maps.push_back(std::move(entry));
        }
        report.maps[it->second].tally.Add(GetMatchResult(record));
    }
}

static void AnalyzePlayers(const Corpus& corpus, const AnalyzerOptions& options, StatisticsReport& report)
{
    std::map<std::string, PlayerStats> players;
    for (const auto& record : corpus.GetRecords())
    {
        if (record.IsError()) continue;
        MatchResult result = GetMatchResult(record);
        for (const auto& name : UniquePlayers(record))
        {
            PlayerStats& ps = players[name];
            ps.name = name;
            ps.matches++;
            ps.tally.Add(result);
        }
    }
    report.unique_players = static_cast<int>(players.size());

    std::vector<PlayerStats> all;
    all.reserve(players.size());
    for (auto& [name, ps] : players)
        all.push_back(ps);

    // Input is in name order, so stable sorts break ties by name.
    std::vector<PlayerStats> active = all;
    std::stable_sort(active.begin(), active.end(), [](const PlayerStats& a, const PlayerStats& b)
    {
        return a.matches > b.matches;
    });
    if (active.size() > options.top_active_players)
        active.resize(options.top_active_players);
    report.most_active = std::move(active);

    std::vector<PlayerStats> qualified;
    for (const auto& ps : all)
    {
        if (ps.tally.Known() >= options.min_qualifying_matches && ps.tally.Known() > 0)
            qualified.push_back(ps);
    }
    // Exact comparison of wins/known without floating point.
    std::stable_sort(qualified.begin(), qualified.end(), [](const PlayerStats& a, const PlayerStats& b)
    {
        int64_t lhs = static_cast<int64_t>(a.tally.wins) * b.tally.Known();
        int64_t rhs = static_cast<int64_t>(b.tally.wins) * a.tally.Known();
        return lhs > rhs;
    });
    if (qualified.size() > options.top_win_rate_players)
        qualified.resize(options.top_win_rate_players);
    report.best_win_rate = std::move(qualified);
}

static void AnalyzeTeamSizes(const Corpus& corpus, StatisticsReport& report)
{
    std::map<int, int> histogram;
    int64_t sum = 0;
    TeamSizeStats& stats = report.team_sizes;

    for (const auto& record : corpus.GetRecords())
    {
        if (record.IsError()) continue;
        int size = static_cast<int>(UniquePlayers(record).size());
        if (stats.matches_counted == 0)
        {
            stats.min = size;
            stats.max = size;
        }
        else
        {
            stats.min = std::min(stats.min, size);
            stats.max = std::max(stats.max, size);
        }
        stats.matches_counted++;
        sum += size;
        histogram[size]++;
    }

    if (stats.matches_counted == 0) return;

    stats.average = static_cast<double>(sum) / stats.matches_counted;
    for (const auto& [size, count] : histogram)
    {
        TeamSizeBucket bucket;
        bucket.size = size;
        bucket.matches = count;
        bucket.percentage = SafeRatio(count, stats.matches_counted) * 100.0;
        stats.distribution.push_back(bucket);
    }
}

static void AnalyzePartnerships(const Corpus& corpus, const AnalyzerOptions& options, StatisticsReport& report)
{
    PartnershipCounts counts = CountPartnerships(corpus);
    report.distinct_partnerships = static_cast<int>(counts.size());

    std::vector<Partnership> pairs;
    pairs.reserve(counts.size());
    for (const auto& [pair, count] : counts)
        pairs.push_back({ pair.first, pair.second, count });

    std::stable_sort(pairs.begin(), pairs.end(), [](const Partnership& a, const Partnership& b)
    {
        return a.matches > b.matches;
    });
    if (pairs.size() > options.top_partnerships)
        pairs.resize(options.top_partnerships);
    report.top_partnerships = std::move(pairs);
}

static void AnalyzeDates(const Corpus& corpus, StatisticsReport& report)
{
    std::map<MatchDate, int> perDay;
    DateStats& stats = report.dates;

    for (const auto& record : corpus.GetRecords())
    {
        FilenameInfo info = ParseReplayFilename(record.filename);
        if (!info.has_date)
        {
            stats.problematic_filenames.push_back(record.filename);
            continue;
        }
        perDay[MatchDate{ info.year, info.month, info.day }]++;
        stats.dated_matches++;
    }

    stats.active_days = static_cast<int>(perDay.size());
    // Earliest date wins a tie.
    for (const auto& [date, count] : perDay)
    {
        if (count > stats.most_active_count)
        {
            stats.has_most_active = true;
            stats.most_active_date = date;
            stats.most_active_count = count;
        }
    }
}

StatisticsReport AnalyzeCorpus(const Corpus& corpus, const AnalyzerOptions& options)
{
    StatisticsReport report;
    report.total_files = corpus.total_files;
    report.processed_files = static_cast<int>(corpus.Size());
    report.stored_processed_files = corpus.processed_files;

    for (const auto& record : corpus.GetRecords())
        report.results.Add(GetMatchResult(record));

    AnalyzeMaps(corpus, report);
    AnalyzePlayers(corpus, options, report);
    AnalyzeTeamSizes(corpus, report);
    AnalyzePartnerships(corpus, options, report);

    std::vector<MatchResult> ordered;
    for (const MatchRecord* record : OrderChronologically(corpus))
        ordered.push_back(GetMatchResult(*record));
    report.streaks = ComputeStreaks(ordered);

    AnalyzeDates(corpus, report);
    return report;
}
