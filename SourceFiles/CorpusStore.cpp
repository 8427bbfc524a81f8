#include "CorpusStore.h"
#include "DebugLog.h"
#include "FilenameInfo.h"
#include <fstream>
#include <sstream>

static const char* kLogTag = "corpus";

MatchRecord BuildMatchRecord(const std::string& filename,
                             const std::vector<Segment>& segments,
                             const BuildInfo& buildInfo,
                             const std::vector<std::string>& players)
{
    MatchRecord record;
    record.filename = ReplayRecordName(filename);

    record.match_details.reserve(segments.size());
    for (const auto& seg : segments)
        record.match_details.push_back(seg.value);

    record.game_version = buildInfo;
    record.players = players;

    FilenameInfo info = ParseReplayFilename(record.filename);
    if (info.has_map)
        record.map_info = MapInfo{ info.map, info.mode };

    return record;
}

// --- Load / save ---

CorpusLoadResult CorpusStore::LoadCorpus(const std::filesystem::path& path, Corpus& out)
{
    CorpusLoadResult result;
    out.Clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        result.status = CorpusLoadStatus::Missing;
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        result.status = CorpusLoadStatus::Recovered;
        result.warning = "Corpus " + path.string() + " is unreadable, starting from an empty corpus";
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    StructuredValue j = StructuredValue::parse(buffer.str(), nullptr, false);
    if (j.is_discarded())
    {
        result.status = CorpusLoadStatus::Recovered;
        result.warning = "Corpus " + path.string() + " is not valid JSON, starting from an empty corpus";
        return result;
    }

    std::string reason;
    if (!CorpusFromJson(j, out, reason))
    {
        out.Clear();
        result.status = CorpusLoadStatus::Recovered;
        result.warning = "Corpus " + path.string() + " is invalid (" + reason + "), starting from an empty corpus";
        return result;
    }

    result.status = CorpusLoadStatus::Loaded;
    return result;
}

bool CorpusStore::SaveCorpus(const std::filesystem::path& path, const Corpus& corpus, std::string& error)
{
    std::string text;
    try
    {
        // Filenames are not guaranteed to be UTF-8.
        text = CorpusToJson(corpus).dump(2, ' ', false, StructuredValue::error_handler_t::replace);
        text += '\n';
    }
    catch (const std::exception& e)
    {
        error = std::string("serialization failed: ") + e.what();
        return false;
    }

    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            error = "cannot open " + tmp.string() + " for writing";
            return false;
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out)
        {
            error = "write to " + tmp.string() + " failed";
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    // rename() replaces the target in one step, so readers see either the
    // old document or the new one.
    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        error = "cannot replace " + path.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

// --- CorpusStore ---

CorpusStore::CorpusStore(std::filesystem::path path, int flushInterval)
    : m_path(std::move(path))
    , m_flushInterval(flushInterval < 1 ? 1 : flushInterval)
{
}

void CorpusStore::BeginTransaction()
{
    // While changes are pending, the in-memory snapshot is newer than the
    // file and this store is the only writer.
    if (m_inTransaction) return;

    CorpusLoadResult loaded = LoadCorpus(m_path, m_corpus);
    if (loaded.status == CorpusLoadStatus::Recovered)
    {
        DebugLog::Warning(kLogTag, loaded.warning);
        m_warnings.push_back(loaded.warning);

        std::filesystem::path backup = m_path;
        backup += ".corrupt";
        std::error_code ec;
        std::filesystem::rename(m_path, backup, ec);
        if (ec)
            DebugLog::Warning(kLogTag, "Could not keep a copy of the discarded corpus: " + ec.message());
        else
            DebugLog::Info(kLogTag, "Discarded corpus moved to " + backup.string());
    }
    m_inTransaction = true;
}

bool CorpusStore::Commit(bool force)
{
    m_pending++;
    if (!force && m_pending < m_flushInterval)
        return true;
    return Flush();
}

bool CorpusStore::Flush()
{
    if (!m_inTransaction || m_pending == 0)
        return true;

    m_corpus.processed_files = static_cast<int>(m_corpus.Size());

    std::string error;
    if (!SaveCorpus(m_path, m_corpus, error))
    {
        m_lastError = error;
        DebugLog::Error(kLogTag, error);
        return false;
    }

    m_pending = 0;
    m_inTransaction = false;
    return true;
}

bool CorpusStore::Initialize(int totalFiles)
{
    BeginTransaction();
    m_corpus.total_files = totalFiles;
    return Commit(true);
}

bool CorpusStore::Reset()
{
    m_corpus.Clear();
    m_inTransaction = true;
    return Commit(true);
}

bool CorpusStore::Update(MatchRecord record)
{
    BeginTransaction();
    m_corpus.Upsert(std::move(record));
    return Commit(false);
}

bool CorpusStore::Update(const std::string& filename,
                         const std::vector<Segment>& segments,
                         const BuildInfo& buildInfo,
                         const std::vector<std::string>& players)
{
    return Update(BuildMatchRecord(filename, segments, buildInfo, players));
}

bool CorpusStore::RecordError(const std::string& filename, const std::string& message)
{
    return Update(MakeErrorRecord(ReplayRecordName(filename), message));
}
