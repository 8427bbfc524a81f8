/**
 * @file TestHelpers.h
 * @brief Scratch directories and byte buffers shared by the unit tests.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace test {

inline std::vector<uint8_t> Bytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

inline std::vector<uint8_t> Bytes(std::initializer_list<int> values)
{
    std::vector<uint8_t> out;
    out.reserve(values.size());
    for (int v : values) out.push_back(static_cast<uint8_t>(v));
    return out;
}

// Directory under the system temp path, removed with everything in it.
class TempDir
{
public:
    TempDir()
    {
        static std::atomic<int> counter{ 0 };
        std::random_device rd;
        _path = std::filesystem::temp_directory_path() /
            ("replay_corpus_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return _path; }

    std::filesystem::path Write(const std::string& name, const std::vector<uint8_t>& content) const
    {
        std::filesystem::path p = _path / name;
        std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
        ofs.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return p;
    }

    std::filesystem::path Write(const std::string& name, const std::string& content) const
    {
        return Write(name, Bytes(content));
    }

    std::string Read(const std::string& name) const
    {
        std::ifstream ifs(_path / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path _path;
};

} // namespace test
