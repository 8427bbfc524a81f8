#include "SegmentScanner.h"
#include "ZlibInflate.h"
#include <algorithm>
#include <cstring>

namespace {

constexpr size_t kZlibMinLookahead = 100;
constexpr size_t kZlibMaxWindow = 50000;

inline bool IsContinuation(uint8_t b) { return (b & 0xC0) == 0x80; }

// Number of leading bytes at data[pos] that are consistent with a UTF-8
// sequence, stopping at the first byte that cannot continue it. need is set
// to the full sequence length, or 0 when the lead byte is not a valid start.
size_t Utf8ValidPrefix(const uint8_t* data, size_t pos, size_t end, size_t& need)
{
    uint8_t lead = data[pos];
    need = 0;
    if (lead < 0x80)
    {
        need = 1;
        return 1;
    }

    size_t tail = 0;
    uint8_t lo = 0x80, hi = 0xBF;    // bounds for the second byte
    if (lead >= 0xC2 && lead <= 0xDF)      { tail = 1; }
    else if (lead == 0xE0)                 { tail = 2; lo = 0xA0; }
    else if (lead >= 0xE1 && lead <= 0xEC) { tail = 2; }
    else if (lead == 0xED)                 { tail = 2; hi = 0x9F; }   // no surrogates
    else if (lead >= 0xEE && lead <= 0xEF) { tail = 2; }
    else if (lead == 0xF0)                 { tail = 3; lo = 0x90; }
    else if (lead >= 0xF1 && lead <= 0xF3) { tail = 3; }
    else if (lead == 0xF4)                 { tail = 3; hi = 0x8F; }   // <= U+10FFFF
    else return 0;

    need = tail + 1;
    size_t matched = 1;
    if (pos + 1 >= end || data[pos + 1] < lo || data[pos + 1] > hi) return matched;
    matched++;
    while (matched < need && pos + matched < end && IsContinuation(data[pos + matched]))
        matched++;
    return matched;
}

// Length of the well-formed UTF-8 sequence at data[pos], or 0 if it is
// malformed or runs past end.
size_t Utf8SequenceLength(const uint8_t* data, size_t pos, size_t end)
{
    size_t need = 0;
    size_t matched = Utf8ValidPrefix(data, pos, end, need);
    return (need != 0 && matched == need) ? need : 0;
}

} // anonymous namespace

size_t FindInvalidUtf8(const uint8_t* data, size_t begin, size_t end)
{
    size_t pos = begin;
    while (pos < end)
    {
        if (data[pos] < 0x80)
        {
            pos++;
            continue;
        }
        size_t n = Utf8SequenceLength(data, pos, end);
        if (n == 0) return pos;
        pos += n;
    }
    return end;
}

size_t InvalidUtf8Length(const uint8_t* data, size_t pos, size_t end)
{
    size_t need = 0;
    size_t matched = Utf8ValidPrefix(data, pos, end, need);
    return matched == 0 ? 1 : matched;
}

bool IsValidUtf8(const uint8_t* data, size_t len)
{
    return FindInvalidUtf8(data, 0, len) == len;
}

std::vector<Segment> ScanSegments(const std::vector<uint8_t>& buffer, const ScanWindow& window)
{
    std::vector<Segment> segments;
    const size_t size = buffer.size();
    const uint8_t* data = buffer.data();

    for (size_t i = 0; i < size; i++)
    {
        if (data[i] != '{') continue;

        const size_t windowEnd = std::min(i + window.max_window, size);
        const size_t first = i + window.min_lookahead;
        if (first >= windowEnd) continue;

        // No candidate reaching past the first bad sequence can decode.
        const size_t limit = std::min(windowEnd, FindInvalidUtf8(data, i, windowEnd));

        const char* base = reinterpret_cast<const char*>(data);
        size_t j = first;
        while (j < limit)
        {
            const void* hit = std::memchr(base + j, '}', limit - j);
            if (!hit) break;
            j = static_cast<size_t>(static_cast<const char*>(hit) - base);

            const char* candBegin = base + i;
            const char* candEnd = base + j + 1;
            if (StructuredValue::accept(candBegin, candEnd))
            {
                StructuredValue value = StructuredValue::parse(candBegin, candEnd, nullptr, false);
                if (!value.is_discarded() && value.is_object())
                {
                    segments.push_back({ i, j, std::move(value) });
                    break;
                }
            }
            j++;
        }
    }

    return segments;
}

std::vector<CompressedChunk> ScanZlibChunks(const std::vector<uint8_t>& buffer)
{
    std::vector<CompressedChunk> chunks;
    const size_t size = buffer.size();
    const uint8_t* data = buffer.data();

    for (size_t i = 0; i + 1 < size; i++)
    {
        if (data[i] != 0x78 || data[i + 1] != 0x9C) continue;

        // Candidate slices are data[i, j) with j in [i + 100, windowEnd).
        const size_t windowEnd = std::min(i + kZlibMaxWindow, size);
        const size_t firstEnd = i + kZlibMinLookahead;
        if (firstEnd >= windowEnd) continue;

        std::vector<uint8_t> inflated;
        size_t streamLen = 0;
        if (!InflateZlib(data + i, windowEnd - 1 - i, inflated, streamLen))
            continue;

        // The shortest slice holding the whole stream, but never below the
        // minimum lookahead (trailing bytes in the slice are ignored).
        size_t end = std::max(i + streamLen, firstEnd);
        if (end >= windowEnd) continue;

        CompressedChunk chunk;
        chunk.start = i;
        chunk.end = end;
        chunk.data = std::move(inflated);
        chunks.push_back(std::move(chunk));
    }

    return chunks;
}

std::vector<std::string> ExtractPrintableStrings(const std::vector<uint8_t>& buffer, size_t minLength)
{
    std::vector<std::string> strings;
    if (minLength == 0) minLength = 1;

    size_t runStart = 0;
    size_t runLen = 0;
    for (size_t i = 0; i <= buffer.size(); i++)
    {
        bool printable = i < buffer.size() && buffer[i] >= 0x20 && buffer[i] <= 0x7E;
        if (printable)
        {
            if (runLen == 0) runStart = i;
            runLen++;
            continue;
        }
        if (runLen >= minLength)
            strings.emplace_back(reinterpret_cast<const char*>(buffer.data()) + runStart, runLen);
        runLen = 0;
    }

    return strings;
}
