#pragma once
#include <string>
#include <vector>

// Fields encoded in the advisory replay filename convention:
//   <index>_<map>_<mode>_<YYYY>_<MM>_<DD>_<hh>_<mm>_<ss>_<hash>.<ext>
// e.g. 05_friendshipdam_conquest_2025_03_01_19_17_51_9147c5c8.replay
struct FilenameInfo
{
    bool has_map = false;
    std::string map;
    std::string mode;

    bool has_date = false;
    int year = 0;
    int month = 0;
    int day = 0;

    bool has_time = false;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

std::vector<std::string> SplitFilename(const std::string& name, char sep = '_');

// Accepts plain decimal digits only ("03" is 3, "+3" and "" are rejected).
bool ParseDecimal(const std::string& text, int& out);

// Never fails; fields that cannot be recovered stay unset.
FilenameInfo ParseReplayFilename(const std::string& filename);
