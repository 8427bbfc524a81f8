#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Structured value recovered from a replay. Object key order is preserved.
using StructuredValue = nlohmann::ordered_json;

// Heuristic policy for locating embedded JSON objects. A candidate starting at
// '{' is closed by the first '}' in [start + min_lookahead, start + max_window)
// that yields a valid document.
struct ScanWindow
{
    size_t min_lookahead = 10;
    size_t max_window = 5000;
};

struct Segment
{
    size_t start = 0;   // offset of '{'
    size_t end = 0;     // offset of the closing '}', inclusive
    StructuredValue value;
};

struct CompressedChunk
{
    size_t start = 0;   // offset of the 0x78 0x9C header
    size_t end = 0;     // exclusive
    std::vector<uint8_t> data;
};

// Returns the offset of the first byte in [begin, end) that starts an invalid
// or truncated UTF-8 sequence, or end if the whole range is valid.
size_t FindInvalidUtf8(const uint8_t* data, size_t begin, size_t end);
// Length of the maximal ill-formed subpart starting at data[pos], which
// FindInvalidUtf8 reported as invalid. Always at least 1.
size_t InvalidUtf8Length(const uint8_t* data, size_t pos, size_t end);
bool IsValidUtf8(const uint8_t* data, size_t len);

// Every '{' is tried as a start, including starts inside an earlier match, so
// nested and overlapping segments are reported.
std::vector<Segment> ScanSegments(const std::vector<uint8_t>& buffer,
                                  const ScanWindow& window = ScanWindow());

// Finds zlib streams with the default-compression header (78 9C). For each
// header the first end in [start + 100, start + 50000) that contains the
// complete stream wins.
std::vector<CompressedChunk> ScanZlibChunks(const std::vector<uint8_t>& buffer);

// Runs of printable ASCII (0x20..0x7E) at least minLength bytes long.
std::vector<std::string> ExtractPrintableStrings(const std::vector<uint8_t>& buffer,
                                                 size_t minLength = 4);
