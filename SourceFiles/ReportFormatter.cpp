#include "ReportFormatter.h"
#include <cstdio>

std::string FormatPercent(double ratio)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f%%", ratio * 100.0);
    return buf;
}

static std::string FormatOneDecimal(double value)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

static StructuredValue TallyToJson(const ResultTally& tally)
{
    StructuredValue j = StructuredValue::object();
    j["total"] = tally.Total();
    j["wins"] = tally.wins;
    j["losses"] = tally.losses;
    j["unknown"] = tally.unknown;
    j["win_rate"] = tally.WinRate();
    return j;
}

static StructuredValue PlayerToJson(const PlayerStats& ps)
{
    StructuredValue j = StructuredValue::object();
    j["name"] = ps.name;
    j["matches"] = ps.matches;
    j["wins"] = ps.tally.wins;
    j["losses"] = ps.tally.losses;
    j["unknown"] = ps.tally.unknown;
    j["win_rate"] = ps.tally.WinRate();
    return j;
}

StructuredValue ReportToJson(const StatisticsReport& report)
{
    StructuredValue j = StructuredValue::object();
    j["total_files"] = report.total_files;
    j["processed_files"] = report.processed_files;
    j["total_matches"] = report.MatchesAnalyzed();

    StructuredValue results = StructuredValue::object();
    results["wins"] = report.results.wins;
    results["losses"] = report.results.losses;
    results["unknown"] = report.results.unknown;
    results["win_ratio"] = report.results.WinRate();
    results["loss_ratio"] = report.results.LossRate();
    j["results"] = std::move(results);

    StructuredValue maps = StructuredValue::object();
    for (const auto& m : report.maps)
        maps[m.Key()] = TallyToJson(m.tally);
    j["map_stats"] = std::move(maps);

    StructuredValue players = StructuredValue::object();
    players["unique_players"] = report.unique_players;
    players["most_active"] = StructuredValue::array();
    for (const auto& ps : report.most_active)
        players["most_active"].push_back(PlayerToJson(ps));
    players["best_win_rate"] = StructuredValue::array();
    for (const auto& ps : report.best_win_rate)
        players["best_win_rate"].push_back(PlayerToJson(ps));
    j["players"] = std::move(players);

    const TeamSizeStats& ts = report.team_sizes;
    StructuredValue teams = StructuredValue::object();
    teams["matches_counted"] = ts.matches_counted;
    teams["average"] = ts.average;
    teams["min"] = ts.min;
    teams["max"] = ts.max;
    teams["distribution"] = StructuredValue::array();
    for (const auto& b : ts.distribution)
        teams["distribution"].push_back({ { "size", b.size }, { "matches", b.matches }, { "percentage", b.percentage } });
    j["team_sizes"] = std::move(teams);

    StructuredValue partners = StructuredValue::object();
    partners["distinct_pairs"] = report.distinct_partnerships;
    partners["top"] = StructuredValue::array();
    for (const auto& p : report.top_partnerships)
        partners["top"].push_back({ { "players", StructuredValue::array({ p.first, p.second }) }, { "matches", p.matches } });
    j["partnerships"] = std::move(partners);

    StructuredValue streaks = StructuredValue::object();
    streaks["max_win_streak"] = report.streaks.max_win_streak;
    streaks["max_loss_streak"] = report.streaks.max_loss_streak;
    streaks["final_streak"] = report.streaks.final_streak;
    j["streaks"] = std::move(streaks);

    const DateStats& ds = report.dates;
    StructuredValue dates = StructuredValue::object();
    dates["dated_matches"] = ds.dated_matches;
    dates["active_days"] = ds.active_days;
    if (ds.has_most_active)
    {
        char buf[16];
        snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
            ds.most_active_date.year, ds.most_active_date.month, ds.most_active_date.day);
        dates["most_active_date"] = buf;
        dates["most_active_count"] = ds.most_active_count;
    }
    else
    {
        dates["most_active_date"] = nullptr;
        dates["most_active_count"] = 0;
    }
    dates["problematic_filenames"] = ds.problematic_filenames;
    j["dates"] = std::move(dates);

    return j;
}

std::string FormatReportText(const StatisticsReport& report, const AnalyzerOptions& options)
{
    std::string out;
    auto line = [&out](const std::string& text) { out += text; out += '\n'; };

    const ResultTally& r = report.results;
    const int matches = report.MatchesAnalyzed();

    line("=== REPLAY DATA ANALYSIS ===");
    line("");
    line("Total files processed: " + std::to_string(report.processed_files) + "/" + std::to_string(report.total_files));
    line("Matches analyzed: " + std::to_string(matches));
    line("");

    line("=== MATCH RESULTS ===");
    line("Wins: " + std::to_string(r.wins));
    line("Losses: " + std::to_string(r.losses));
    line("Unknown/Invalid: " + std::to_string(r.unknown));
    line("Win Ratio: " + FormatPercent(r.WinRate()));
    if (r.Known() > 0)
        line("Loss Ratio: " + FormatPercent(r.LossRate()));
    line("");

    line("=== MAP STATISTICS ===");
    for (const auto& m : report.maps)
    {
        line(m.Key() + ":");
        line("  Matches: " + std::to_string(m.tally.Total()) +
            " (WINS: " + std::to_string(m.tally.wins) +
            ", LOSSES: " + std::to_string(m.tally.losses) +
            ", UNKNOWN: " + std::to_string(m.tally.unknown) + ")");
        if (m.tally.Known() > 0)
            line("  Win Rate: " + FormatPercent(m.tally.WinRate()));
        else
            line("  Win Rate: N/A (no known results)");
    }
    line("");

    line("=== PLAYER STATISTICS ===");
    line("Total unique players: " + std::to_string(report.unique_players));
    line("");
    line("Top " + std::to_string(options.top_active_players) + " Most Active Players:");
    for (const auto& ps : report.most_active)
    {
        line("  " + ps.name + ": " + std::to_string(ps.matches) + " matches (" +
            FormatPercent(ps.tally.WinRate()) + " win rate, unknown: " + std::to_string(ps.tally.unknown) + ")");
    }
    line("");
    if (!report.best_win_rate.empty())
    {
        line("Top " + std::to_string(options.top_win_rate_players) + " Players by Win Rate (min " +
            std::to_string(options.min_qualifying_matches) + " known matches):");
        for (const auto& ps : report.best_win_rate)
        {
            line("  " + ps.name + ": " + FormatPercent(ps.tally.WinRate()) + " (" +
                std::to_string(ps.tally.wins) + "-" + std::to_string(ps.tally.losses) +
                ", ?: " + std::to_string(ps.tally.unknown) + ")");
        }
        line("");
    }

    const TeamSizeStats& ts = report.team_sizes;
    line("=== PLAYERS PER MATCH ANALYSIS ===");
    line("Average players per match: " + FormatOneDecimal(ts.average));
    line("Minimum players per match: " + std::to_string(ts.min));
    line("Maximum players per match: " + std::to_string(ts.max));
    line("");
    line("Team Size Distribution:");
    for (const auto& b : ts.distribution)
    {
        line("  " + std::to_string(b.size) + " players: " + std::to_string(b.matches) +
            " matches (" + FormatOneDecimal(b.percentage) + "%)");
    }
    line("");

    line("=== PLAYER PARTNERSHIPS ===");
    line("Distinct teammate pairs: " + std::to_string(report.distinct_partnerships));
    line("Top " + std::to_string(options.top_partnerships) + " Most Frequent Teammate Pairs:");
    for (const auto& p : report.top_partnerships)
        line("  " + p.first + " & " + p.second + ": " + std::to_string(p.matches) + " matches together");
    line("");

    const DateStats& ds = report.dates;
    line("=== TIME ANALYSIS ===");
    if (ds.has_most_active)
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "Most active date: %d/%d/%d (%d matches)",
            ds.most_active_date.month, ds.most_active_date.day, ds.most_active_date.year, ds.most_active_count);
        line(buf);
        line("Total days with matches: " + std::to_string(ds.active_days));
    }
    else
    {
        line("No valid dates found in filenames");
    }
    if (!ds.problematic_filenames.empty())
    {
        line("");
        line("Note: " + std::to_string(ds.problematic_filenames.size()) +
            " files had problematic filenames for date parsing");
    }
    line("");

    line("=== STREAK ANALYSIS ===");
    line("Longest win streak: " + std::to_string(report.streaks.max_win_streak));
    line("Longest loss streak: " + std::to_string(report.streaks.max_loss_streak));
    line("");

    line("=== SUMMARY ===");
    line("Total matches: " + std::to_string(matches));
    line("Matches with known results: " + std::to_string(r.Known()) + " (" +
        FormatOneDecimal(SafeRatio(r.Known(), matches) * 100.0) + "%)");
    line("Overall win rate: " + FormatPercent(r.WinRate()));
    line("Unique players: " + std::to_string(report.unique_players));
    line("Average team size: " + FormatOneDecimal(ts.average));

    return out;
}
