#include "MetadataExtractor.h"
#include "SegmentScanner.h"
#include <algorithm>
#include <set>

namespace {

constexpr size_t kHandleMinName = 3;
constexpr size_t kHandleMaxName = 20;
constexpr size_t kHandleMinDigits = 3;
constexpr size_t kHandleMaxDigits = 6;

inline bool IsWordByte(uint8_t c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

inline bool IsDigitByte(uint8_t c)
{
    return c >= '0' && c <= '9';
}

// Tries to match a handle whose name run starts at pos (pos is a word start).
// On success end is one past the last digit.
bool MatchHandleAt(const std::vector<uint8_t>& buf, size_t pos, size_t& end)
{
    const size_t size = buf.size();

    // '#' is not a word byte, so the name must be the whole word run.
    size_t nameEnd = pos;
    while (nameEnd < size && IsWordByte(buf[nameEnd])) nameEnd++;
    size_t nameLen = nameEnd - pos;
    if (nameLen < kHandleMinName || nameLen > kHandleMaxName) return false;
    if (nameEnd >= size || buf[nameEnd] != '#') return false;

    // Backtracking to fewer digits would leave a digit after the match, which
    // is never a word boundary. So the digit run must fit entirely.
    size_t digitStart = nameEnd + 1;
    size_t digitEnd = digitStart;
    while (digitEnd < size && IsDigitByte(buf[digitEnd])) digitEnd++;
    size_t digitLen = digitEnd - digitStart;
    if (digitLen < kHandleMinDigits || digitLen > kHandleMaxDigits) return false;
    if (digitEnd < size && IsWordByte(buf[digitEnd])) return false;

    end = digitEnd;
    return true;
}

} // anonymous namespace

std::string DecodeLossy(const uint8_t* data, size_t len)
{
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(len);
    size_t pos = 0;
    while (pos < len)
    {
        size_t bad = FindInvalidUtf8(data, pos, len);
        out.append(reinterpret_cast<const char*>(data) + pos, bad - pos);
        if (bad == len) break;
        out.append(kReplacement, 3);
        pos = bad + InvalidUtf8Length(data, bad, len);
    }
    return out;
}

std::string ReplayRecordName(const std::filesystem::path& path)
{
    const std::string name = path.filename().string();
    return DecodeLossy(reinterpret_cast<const uint8_t*>(name.data()), name.size());
}

std::optional<std::string> ExtractQuotedField(const std::vector<uint8_t>& buffer, const std::string& key)
{
    // The prefix and the quote are ASCII and never occur inside a multi-byte
    // sequence, so searching the raw bytes finds the same spot as searching
    // the decoded text.
    const std::string prefix = key + ": '";
    auto it = std::search(buffer.begin(), buffer.end(), prefix.begin(), prefix.end());
    if (it == buffer.end()) return std::nullopt;

    auto valueBegin = it + static_cast<std::ptrdiff_t>(prefix.size());
    auto valueEnd = std::find(valueBegin, buffer.end(), static_cast<uint8_t>('\''));
    if (valueEnd == buffer.end()) return std::nullopt;

    return DecodeLossy(buffer.data() + (valueBegin - buffer.begin()),
                       static_cast<size_t>(valueEnd - valueBegin));
}

BuildInfo ExtractBuildInfo(const std::vector<uint8_t>& buffer)
{
    BuildInfo info;
    info.build = ExtractQuotedField(buffer, "build");
    info.branch = ExtractQuotedField(buffer, "branch");
    return info;
}

std::vector<std::string> ExtractPlayerNames(const std::vector<uint8_t>& buffer)
{
    std::set<std::string> names;
    const size_t size = buffer.size();

    size_t pos = 0;
    while (pos < size)
    {
        // A match can only begin where a word run begins.
        if (!IsWordByte(buffer[pos]) || (pos > 0 && IsWordByte(buffer[pos - 1])))
        {
            pos++;
            continue;
        }

        size_t end = 0;
        if (MatchHandleAt(buffer, pos, end))
        {
            names.emplace(reinterpret_cast<const char*>(buffer.data()) + pos, end - pos);
            pos = end;
            continue;
        }

        while (pos < size && IsWordByte(buffer[pos])) pos++;
    }

    return std::vector<std::string>(names.begin(), names.end());
}
