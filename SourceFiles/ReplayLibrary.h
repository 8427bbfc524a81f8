#pragma once
#include "SegmentScanner.h"
#include "MetadataExtractor.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// Everything recovered from one replay file. Pure function of its bytes.
struct ReplayExtraction
{
    std::filesystem::path path;
    std::string filename;           // basename, the corpus key
    bool found = false;
    std::string error;              // set when the file could not be read
    size_t file_size = 0;

    std::vector<Segment> segments;
    BuildInfo build_info;
    std::vector<std::string> players;
};

bool ReadReplayBytes(const std::filesystem::path& path, std::vector<uint8_t>& out, std::string& error);

ReplayExtraction ExtractReplayBuffer(const std::string& filename, const std::vector<uint8_t>& buffer);
ReplayExtraction ProcessReplayFile(const std::filesystem::path& path);

class IReplayProvider
{
public:
    virtual ~IReplayProvider() = default;
    virtual std::vector<std::filesystem::path> GetAvailableReplays() = 0;
};

class LocalReplayProvider : public IReplayProvider
{
public:
    void SetFolder(const std::string& path);
    void SetExtension(const std::string& extension);
    std::vector<std::filesystem::path> GetAvailableReplays() override;

private:
    std::string m_folder_path;
    std::string m_extension = ".replay";
};

class ReplayLibrary
{
public:
    void SetReplayFolder(const std::string& path);
    void SetExtension(const std::string& extension);
    void ScanFolder();
    void Clear();

    const std::vector<std::filesystem::path>& GetReplays() const { return m_replays; }
    bool IsLoaded() const { return m_loaded; }
    const std::string& GetFolderPath() const { return m_folder_path; }
    int GetReplayCount() const { return static_cast<int>(m_replays.size()); }

private:
    LocalReplayProvider m_provider;
    std::vector<std::filesystem::path> m_replays;
    std::string m_folder_path;
    bool m_loaded = false;
};
