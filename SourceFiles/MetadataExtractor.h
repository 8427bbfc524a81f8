#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct BuildInfo
{
    std::optional<std::string> build;
    std::optional<std::string> branch;

    bool operator==(const BuildInfo&) const = default;
};

// Replaces each maximal ill-formed UTF-8 subpart with one U+FFFD. A
// truncated sequence such as E2 82 becomes a single replacement character.
std::string DecodeLossy(const uint8_t* data, size_t len);

// Corpus key for a replay path: the basename, lossily decoded so it survives
// a round trip through the JSON corpus unchanged.
std::string ReplayRecordName(const std::filesystem::path& path);

// Value between the quotes of the first "<key>: '...'" occurrence, or nullopt
// when the prefix is missing or never closed.
std::optional<std::string> ExtractQuotedField(const std::vector<uint8_t>& buffer, const std::string& key);

BuildInfo ExtractBuildInfo(const std::vector<uint8_t>& buffer);

// Player handles: 3-20 ASCII word characters, '#', 3-6 digits, with a word
// boundary on both sides. Matches are non-overlapping, returned sorted and
// deduplicated.
std::vector<std::string> ExtractPlayerNames(const std::vector<uint8_t>& buffer);
