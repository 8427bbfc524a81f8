#include "ReplayLibrary.h"
#include "DebugLog.h"
#include <algorithm>
#include <cctype>
#include <fstream>

static std::string ToLower(const std::string& s)
{
    std::string r = s;
    for (auto& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return r;
}

bool ReadReplayBytes(const std::filesystem::path& path, std::vector<uint8_t>& out, std::string& error)
{
    out.clear();

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open())
    {
        error = "cannot open " + path.string();
        return false;
    }

    auto end = file.tellg();
    if (end < 0)
    {
        error = "cannot size " + path.string();
        return false;
    }

    out.resize(static_cast<size_t>(end));
    file.seekg(0);
    if (!out.empty())
        file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (!file)
    {
        error = "read failed: " + path.string();
        out.clear();
        return false;
    }
    return true;
}

ReplayExtraction ExtractReplayBuffer(const std::string& filename, const std::vector<uint8_t>& buffer)
{
    ReplayExtraction result;
    result.filename = ReplayRecordName(filename);
    result.path = filename;
    result.found = true;
    result.file_size = buffer.size();

    result.segments = ScanSegments(buffer);
    result.build_info = ExtractBuildInfo(buffer);
    result.players = ExtractPlayerNames(buffer);
    return result;
}

ReplayExtraction ProcessReplayFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        ReplayExtraction missing;
        missing.path = path;
        missing.filename = ReplayRecordName(path);
        missing.error = "File not found";
        return missing;
    }

    std::vector<uint8_t> buffer;
    std::string error;
    if (!ReadReplayBytes(path, buffer, error))
    {
        ReplayExtraction unreadable;
        unreadable.path = path;
        unreadable.filename = ReplayRecordName(path);
        unreadable.found = true;
        unreadable.error = error;
        return unreadable;
    }

    ReplayExtraction result = ExtractReplayBuffer(path.string(), buffer);
    result.path = path;
    return result;
}

// --- LocalReplayProvider ---

void LocalReplayProvider::SetFolder(const std::string& path)
{
    m_folder_path = path;
}

void LocalReplayProvider::SetExtension(const std::string& extension)
{
    m_extension = extension;
    if (!m_extension.empty() && m_extension[0] != '.')
        m_extension.insert(m_extension.begin(), '.');
}

std::vector<std::filesystem::path> LocalReplayProvider::GetAvailableReplays()
{
    std::vector<std::filesystem::path> results;

    std::error_code ec;
    if (m_folder_path.empty() || !std::filesystem::is_directory(m_folder_path, ec))
    {
        DebugLog::Warning("library", "Replay folder not found: " + m_folder_path);
        return results;
    }

    const std::string wanted = ToLower(m_extension);
    for (const auto& entry : std::filesystem::directory_iterator(m_folder_path, ec))
    {
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc)) continue;
        if (!wanted.empty() && ToLower(entry.path().extension().string()) != wanted) continue;
        results.push_back(entry.path());
    }
    if (ec)
        DebugLog::Warning("library", "Listing " + m_folder_path + " stopped early: " + ec.message());

    // Directory order is unspecified; a sorted list keeps batches repeatable.
    std::sort(results.begin(), results.end());
    return results;
}

// --- ReplayLibrary ---

void ReplayLibrary::SetReplayFolder(const std::string& path)
{
    m_folder_path = path;
    m_provider.SetFolder(path);
}

void ReplayLibrary::SetExtension(const std::string& extension)
{
    m_provider.SetExtension(extension);
}

void ReplayLibrary::ScanFolder()
{
    m_replays.clear();
    m_loaded = false;

    if (m_folder_path.empty()) return;

    m_replays = m_provider.GetAvailableReplays();
    m_loaded = true;
}

void ReplayLibrary::Clear()
{
    m_replays.clear();
    m_loaded = false;
    m_folder_path.clear();
}
