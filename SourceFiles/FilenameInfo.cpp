#include "FilenameInfo.h"
#include <charconv>
#include <filesystem>

namespace {

constexpr size_t kMapIndex = 1;
constexpr size_t kModeIndex = 2;
constexpr size_t kYearIndex = 3;
constexpr size_t kMonthIndex = 4;
constexpr size_t kDayIndex = 5;
constexpr size_t kHourIndex = 6;
constexpr size_t kMinuteIndex = 7;
constexpr size_t kSecondIndex = 8;

// A date is only trusted when the name carries at least one token past it.
constexpr size_t kMinPartsForDate = 7;

} // anonymous namespace

std::vector<std::string> SplitFilename(const std::string& name, char sep)
{
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;)
    {
        size_t pos = name.find(sep, start);
        if (pos == std::string::npos)
        {
            parts.push_back(name.substr(start));
            break;
        }
        parts.push_back(name.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool ParseDecimal(const std::string& text, int& out)
{
    if (text.empty()) return false;
    for (char c : text)
        if (c < '0' || c > '9') return false;

    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return false;
    out = value;
    return true;
}

FilenameInfo ParseReplayFilename(const std::string& filename)
{
    FilenameInfo info;
    const std::string base = std::filesystem::path(filename).filename().string();
    const auto parts = SplitFilename(base);

    if (parts.size() > kModeIndex)
    {
        info.has_map = true;
        info.map = parts[kMapIndex];
        info.mode = parts[kModeIndex];
    }

    if (parts.size() >= kMinPartsForDate)
    {
        int y = 0, m = 0, d = 0;
        if (ParseDecimal(parts[kYearIndex], y) &&
            ParseDecimal(parts[kMonthIndex], m) &&
            ParseDecimal(parts[kDayIndex], d))
        {
            info.has_date = true;
            info.year = y;
            info.month = m;
            info.day = d;

            int hh = 0, mm = 0, ss = 0;
            if (parts.size() > kSecondIndex &&
                ParseDecimal(parts[kHourIndex], hh) &&
                ParseDecimal(parts[kMinuteIndex], mm) &&
                ParseDecimal(parts[kSecondIndex], ss))
            {
                info.has_time = true;
                info.hour = hh;
                info.minute = mm;
                info.second = ss;
            }
        }
    }

    return info;
}
