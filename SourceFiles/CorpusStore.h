#pragma once
#include "CorpusData.h"
#include <filesystem>
#include <string>
#include <vector>

enum class CorpusLoadStatus
{
    Loaded,
    Missing,     // no corpus yet, started empty
    Recovered,   // unreadable or invalid, started empty
};

struct CorpusLoadResult
{
    CorpusLoadStatus status = CorpusLoadStatus::Missing;
    std::string warning;     // set when status is Recovered
};

// Owns the corpus document on disk. Every change is a transaction: load the
// current document, apply the change, replace the file atomically. With a
// flush interval above 1 the loaded snapshot is reused and written every N
// changes; the file on disk is always a complete document.
//
// Not thread-safe: exactly one writer may use a store at a time.
class CorpusStore
{
public:
    explicit CorpusStore(std::filesystem::path path, int flushInterval = 1);

    // Sets total_files for a new batch. Existing results are kept.
    bool Initialize(int totalFiles);

    // Drops every record and writes an empty corpus.
    bool Reset();

    bool Update(const std::string& filename,
                const std::vector<Segment>& segments,
                const BuildInfo& buildInfo,
                const std::vector<std::string>& players);
    bool Update(MatchRecord record);
    bool RecordError(const std::string& filename, const std::string& message);

    // Writes pending changes. No-op when nothing is pending.
    bool Flush();

    const Corpus& GetSnapshot() const { return m_corpus; }
    const std::filesystem::path& GetPath() const { return m_path; }
    int GetPendingUpdates() const { return m_pending; }
    const std::string& GetLastError() const { return m_lastError; }

    // Recoveries from a corrupt document seen by this store, oldest first.
    const std::vector<std::string>& GetWarnings() const { return m_warnings; }

    static CorpusLoadResult LoadCorpus(const std::filesystem::path& path, Corpus& out);
    static bool SaveCorpus(const std::filesystem::path& path, const Corpus& corpus, std::string& error);

private:
    void BeginTransaction();
    bool Commit(bool force);

    std::filesystem::path m_path;
    int m_flushInterval = 1;
    int m_pending = 0;
    bool m_inTransaction = false;
    Corpus m_corpus;
    std::string m_lastError;
    std::vector<std::string> m_warnings;
};

// The record a replay produces, keyed by its basename.
MatchRecord BuildMatchRecord(const std::string& filename,
                             const std::vector<Segment>& segments,
                             const BuildInfo& buildInfo,
                             const std::vector<std::string>& players);
