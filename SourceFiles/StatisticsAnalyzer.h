#pragma once
#include "CorpusData.h"
#include <compare>
#include <map>
#include <string>
#include <utility>
#include <vector>

enum class MatchResult { Win, Loss, Unknown };

const char* MatchResultName(MatchResult result);

// Reads m_endGameType from the first match_details segment ("details" object
// first, then the segment itself). "Win" and "Loose" are the only known
// outcomes; anything else, including a missing segment, is Unknown.
MatchResult GetMatchResult(const MatchRecord& record);

// num / den, or 0 when den is 0.
double SafeRatio(int num, int den);

struct ResultTally
{
    int wins = 0;
    int losses = 0;
    int unknown = 0;

    void Add(MatchResult result);
    int Known() const { return wins + losses; }
    int Total() const { return wins + losses + unknown; }
    double WinRate() const { return SafeRatio(wins, Known()); }
    double LossRate() const { return SafeRatio(losses, Known()); }
};

struct MapModeStats
{
    std::string map;
    std::string mode;
    ResultTally tally;

    std::string Key() const { return map + " (" + mode + ")"; }
};

struct PlayerStats
{
    std::string name;
    int matches = 0;
    ResultTally tally;
};

struct TeamSizeBucket
{
    int size = 0;
    int matches = 0;
    double percentage = 0.0;
};

struct TeamSizeStats
{
    int matches_counted = 0;     // error records have no player list
    double average = 0.0;
    int min = 0;
    int max = 0;
    std::vector<TeamSizeBucket> distribution;   // ascending size
};

struct Partnership
{
    std::string first;     // first < second
    std::string second;
    int matches = 0;
};

struct StreakStats
{
    int max_win_streak = 0;
    int max_loss_streak = 0;
    int final_streak = 0;    // signed: > 0 wins, < 0 losses
};

struct MatchDate
{
    int year = 0;
    int month = 0;
    int day = 0;

    auto operator<=>(const MatchDate&) const = default;
};

struct DateStats
{
    int dated_matches = 0;
    int active_days = 0;
    bool has_most_active = false;
    MatchDate most_active_date;
    int most_active_count = 0;
    std::vector<std::string> problematic_filenames;
};

struct AnalyzerOptions
{
    size_t top_active_players = 10;
    size_t top_win_rate_players = 5;
    int min_qualifying_matches = 2;
    size_t top_partnerships = 10;
};

struct StatisticsReport
{
    int total_files = 0;
    int processed_files = 0;         // records actually present
    int stored_processed_files = 0;  // what the corpus header claims

    ResultTally results;
    std::vector<MapModeStats> maps;  // first-seen order

    int unique_players = 0;
    std::vector<PlayerStats> most_active;
    std::vector<PlayerStats> best_win_rate;

    TeamSizeStats team_sizes;
    int distinct_partnerships = 0;
    std::vector<Partnership> top_partnerships;
    StreakStats streaks;
    DateStats dates;

    int MatchesAnalyzed() const { return processed_files; }
};

using PartnershipCounts = std::map<std::pair<std::string, std::string>, int>;

// Each unordered pair of distinct players counted once per match.
PartnershipCounts CountPartnerships(const Corpus& corpus);

// Records ordered by filename date and time; records without a date follow
// in corpus order.
std::vector<const MatchRecord*> OrderChronologically(const Corpus& corpus);

StreakStats ComputeStreaks(const std::vector<MatchResult>& ordered);

StatisticsReport AnalyzeCorpus(const Corpus& corpus, const AnalyzerOptions& options = AnalyzerOptions());
