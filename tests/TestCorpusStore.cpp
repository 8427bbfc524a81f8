/**
 * @file TestCorpusStore.cpp
 * @brief Unit tests for the corpus document and its on-disk store.
 */

#include <catch2/catch_test_macros.hpp>

#include "CorpusStore.h"
#include "DebugLog.h"
#include "TestHelpers.h"

#include <mutex>

namespace {

std::vector<Segment> OneSegment(const StructuredValue& value)
{
    Segment seg;
    seg.start = 0;
    seg.end = 10;
    seg.value = value;
    return { seg };
}

class WarningCounter : public ILogSink
{
public:
    void Write(LogLevel level, const std::string&, const std::string&) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (level == LogLevel::Warning) warnings++;
    }

    std::mutex mutex;
    int warnings = 0;
};

StructuredValue ReadDocument(const test::TempDir& dir, const std::string& name)
{
    return StructuredValue::parse(dir.Read(name), nullptr, false);
}

} // namespace

TEST_CASE("Corpus upsert keeps insertion order", "[corpus]")
{
    Corpus corpus;
    MatchRecord a;
    a.filename = "a.replay";
    MatchRecord b;
    b.filename = "b.replay";

    corpus.Upsert(a);
    corpus.Upsert(b);
    REQUIRE(corpus.processed_files == 2);

    MatchRecord a2;
    a2.filename = "a.replay";
    a2.players = { "someone#123" };
    corpus.Upsert(a2);

    REQUIRE(corpus.Size() == 2);
    REQUIRE(corpus.processed_files == 2);
    REQUIRE(corpus.GetRecords()[0].filename == "a.replay");
    REQUIRE(corpus.GetRecords()[0].players.size() == 1);
    REQUIRE(corpus.Find("b.replay") != nullptr);
    REQUIRE(corpus.Find("c.replay") == nullptr);
}

TEST_CASE("Corpus JSON mapping", "[corpus][json]")
{
    SECTION("record fields")
    {
        MatchRecord record = BuildMatchRecord("dir/01_canyon_assault_2024_01_02_03_04_05_x.replay",
            OneSegment({ { "details", { { "m_endGameType", "Win" } } } }),
            BuildInfo{ "1.2.3", std::nullopt },
            { "alpha#111", "beta#222" });

        StructuredValue j = MatchRecordToJson(record);
        REQUIRE(record.filename == "01_canyon_assault_2024_01_02_03_04_05_x.replay");
        REQUIRE(j["match_details"].size() == 1);
        REQUIRE(j["game_version"]["build"] == "1.2.3");
        REQUIRE(j["game_version"]["branch"].is_null());
        REQUIRE(j["players"] == StructuredValue::array({ "alpha#111", "beta#222" }));
        REQUIRE(j["map_info"]["map"] == "canyon");
        REQUIRE(j["map_info"]["mode"] == "assault");
    }

    SECTION("error record")
    {
        StructuredValue j = MatchRecordToJson(MakeErrorRecord("gone.replay", "File not found"));
        REQUIRE(j == StructuredValue{ { "error", "File not found" } });

        MatchRecord back = MatchRecordFromJson("gone.replay", j);
        REQUIRE(back.IsError());
        REQUIRE(*back.error == "File not found");
    }

    SECTION("malformed record becomes an error record")
    {
        MatchRecord back = MatchRecordFromJson("odd.replay", StructuredValue(42));
        REQUIRE(back.IsError());
    }

    SECTION("document without results is rejected")
    {
        Corpus corpus;
        std::string error;
        REQUIRE_FALSE(CorpusFromJson(StructuredValue{ { "total_files", 3 } }, corpus, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(CorpusFromJson(StructuredValue::array(), corpus, error));
    }

    SECTION("counts outside the int range are rejected")
    {
        Corpus corpus;
        std::string error;
        auto withTotal = [](const StructuredValue& total)
        {
            return StructuredValue{ { "total_files", total }, { "results", StructuredValue::object() } };
        };

        REQUIRE_FALSE(CorpusFromJson(withTotal(5000000000LL), corpus, error));
        REQUIRE_FALSE(error.empty());
        REQUIRE_FALSE(CorpusFromJson(withTotal(-1), corpus, error));
        REQUIRE_FALSE(CorpusFromJson(withTotal(18446744073709551615ULL), corpus, error));
        REQUIRE(CorpusFromJson(withTotal(2147483647), corpus, error));
        REQUIRE(corpus.total_files == 2147483647);
    }

    SECTION("stored counts are kept")
    {
        StructuredValue j = {
            { "total_files", 5 },
            { "processed_files", 3 },
            { "results", { { "x.replay", { { "players", StructuredValue::array() } } } } },
        };
        Corpus corpus;
        std::string error;
        REQUIRE(CorpusFromJson(j, corpus, error));
        REQUIRE(corpus.total_files == 5);
        REQUIRE(corpus.processed_files == 3);
        REQUIRE(corpus.Size() == 1);
    }
}

TEST_CASE("CorpusStore keeps processed_files equal to the result count", "[corpus][store]")
{
    test::TempDir dir;
    CorpusStore store(dir.path() / "corpus.json");

    REQUIRE(store.Initialize(3));
    REQUIRE(store.Update("one.replay", OneSegment({ { "k", 1 } }), BuildInfo{}, { "p#123" }));
    REQUIRE(store.RecordError("two.replay", "File not found"));

    StructuredValue doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["total_files"] == 3);
    REQUIRE(doc["processed_files"] == 2);
    REQUIRE(doc["results"].size() == 2);
    REQUIRE(doc["results"]["two.replay"] == StructuredValue{ { "error", "File not found" } });

    // Updating the same file again replaces it.
    REQUIRE(store.Update("one.replay", OneSegment({ { "k", 2 } }), BuildInfo{}, {}));
    doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["processed_files"] == 2);
    REQUIRE(doc["results"]["one.replay"]["match_details"][0]["k"] == 2);
    REQUIRE(doc["results"].begin().key() == "one.replay");
}

TEST_CASE("CorpusStore writes are idempotent", "[corpus][store]")
{
    test::TempDir dir;
    const auto path = dir.path() / "corpus.json";

    auto run = [&path]()
    {
        CorpusStore store(path);
        REQUIRE(store.Initialize(2));
        REQUIRE(store.Update("a.replay", OneSegment({ { "v", "x" } }), BuildInfo{ "1", "main" }, { "a#111" }));
        REQUIRE(store.Update("b.replay", {}, BuildInfo{}, {}));
    };

    run();
    const std::string first = dir.Read("corpus.json");
    run();
    const std::string second = dir.Read("corpus.json");

    REQUIRE(first == second);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "corpus.json.tmp"));
}

TEST_CASE("CorpusStore keeps one record for a non-UTF-8 filename across runs", "[corpus][store]")
{
    test::TempDir dir;
    const auto path = dir.path() / "corpus.json";
    const std::string name = std::string("01_map_mode_2025_01_01_x") + "\xFF" + ".replay";

    auto run = [&]()
    {
        CorpusStore store(path);
        REQUIRE(store.Initialize(1));
        REQUIRE(store.Update(name, OneSegment({ { "k", 1 } }), BuildInfo{}, {}));
        return dir.Read("corpus.json");
    };

    const std::string first = run();
    const std::string second = run();
    REQUIRE(first == second);

    StructuredValue doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["processed_files"] == 1);
    REQUIRE(doc["results"].size() == 1);
    REQUIRE(doc["results"].contains("01_map_mode_2025_01_01_x\xEF\xBF\xBD.replay"));
}

TEST_CASE("CorpusStore recovers from a corrupt document", "[corpus][store]")
{
    test::TempDir dir;
    dir.Write("corpus.json", std::string("{\"total_files\": 4, \"results\": {"));

    auto counter = std::make_shared<WarningCounter>();
    DebugLog::SetSink(counter);
    DebugLog::SetMinLevel(LogLevel::Info);

    CorpusStore store(dir.path() / "corpus.json");
    bool updated = store.Update("fresh.replay", {}, BuildInfo{}, {});
    DebugLog::SetSink(nullptr);

    REQUIRE(updated);
    REQUIRE(store.GetWarnings().size() == 1);
    REQUIRE(counter->warnings == 1);
    REQUIRE(std::filesystem::exists(dir.path() / "corpus.json.corrupt"));

    StructuredValue doc = ReadDocument(dir, "corpus.json");
    REQUIRE_FALSE(doc.is_discarded());
    REQUIRE(doc["total_files"] == 0);
    REQUIRE(doc["processed_files"] == 1);
    REQUIRE(doc["results"].contains("fresh.replay"));
}

TEST_CASE("CorpusStore load statuses", "[corpus][store]")
{
    test::TempDir dir;
    Corpus corpus;

    REQUIRE(CorpusStore::LoadCorpus(dir.path() / "absent.json", corpus).status == CorpusLoadStatus::Missing);

    dir.Write("wrong.json", std::string("[1, 2, 3]"));
    CorpusLoadResult wrong = CorpusStore::LoadCorpus(dir.path() / "wrong.json", corpus);
    REQUIRE(wrong.status == CorpusLoadStatus::Recovered);
    REQUIRE_FALSE(wrong.warning.empty());

    dir.Write("good.json", std::string("{\"total_files\": 1, \"processed_files\": 1, \"results\": {\"a\": {}}}"));
    REQUIRE(CorpusStore::LoadCorpus(dir.path() / "good.json", corpus).status == CorpusLoadStatus::Loaded);
    REQUIRE(corpus.Size() == 1);
}

TEST_CASE("CorpusStore batches writes with a flush interval", "[corpus][store]")
{
    test::TempDir dir;
    const auto path = dir.path() / "corpus.json";
    CorpusStore store(path, 3);

    REQUIRE(store.Initialize(4));
    REQUIRE(store.Update("a.replay", {}, BuildInfo{}, {}));
    REQUIRE(store.Update("b.replay", {}, BuildInfo{}, {}));
    REQUIRE(store.GetPendingUpdates() == 2);
    REQUIRE(ReadDocument(dir, "corpus.json")["processed_files"] == 0);

    REQUIRE(store.Update("c.replay", {}, BuildInfo{}, {}));
    REQUIRE(store.GetPendingUpdates() == 0);
    REQUIRE(ReadDocument(dir, "corpus.json")["processed_files"] == 3);

    REQUIRE(store.Update("d.replay", {}, BuildInfo{}, {}));
    REQUIRE(store.Flush());
    StructuredValue doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["processed_files"] == 4);
    REQUIRE(doc["results"].size() == 4);
}

TEST_CASE("CorpusStore keeps results across batches and resets on request", "[corpus][store]")
{
    test::TempDir dir;
    const auto path = dir.path() / "corpus.json";

    {
        CorpusStore store(path);
        REQUIRE(store.Initialize(1));
        REQUIRE(store.Update("kept.replay", {}, BuildInfo{}, {}));
    }

    CorpusStore store(path);
    REQUIRE(store.Initialize(5));
    StructuredValue doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["total_files"] == 5);
    REQUIRE(doc["results"].contains("kept.replay"));

    REQUIRE(store.Reset());
    doc = ReadDocument(dir, "corpus.json");
    REQUIRE(doc["results"].empty());
    REQUIRE(doc["processed_files"] == 0);
}
