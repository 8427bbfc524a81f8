/**
 * @file TestBatchProcessor.cpp
 * @brief Unit tests for replay discovery and the batch pipeline.
 */

#include <catch2/catch_test_macros.hpp>

#include "BatchProcessor.h"
#include "ReplayLibrary.h"
#include "TestHelpers.h"

namespace {

std::string ReplayBody(const std::string& result, const std::string& player)
{
    return std::string("\x01\x02header build: '1.0.5' branch: 'live'\x03") +
        "{\"details\":{\"m_endGameType\":\"" + result + "\"}}\x04" + player + "\x05";
}

void WriteReplays(const test::TempDir& dir, int count)
{
    for (int i = 0; i < count; i++)
    {
        std::string name = "0" + std::to_string(i) + "_canyon_assault_2025_01_0" + std::to_string(i % 9 + 1) +
            "_10_00_00_h.replay";
        dir.Write(name, ReplayBody(i % 2 == 0 ? "Win" : "Loose", "pilot" + std::to_string(i) + "#1234"));
    }
}

} // namespace

TEST_CASE("ReplayLibrary lists matching files in sorted order", "[library]")
{
    test::TempDir dir;
    dir.Write("b.replay", std::string("x"));
    dir.Write("a.REPLAY", std::string("x"));
    dir.Write("notes.txt", std::string("x"));
    std::filesystem::create_directories(dir.path() / "sub.replay");

    ReplayLibrary library;
    library.SetReplayFolder(dir.path().string());
    library.SetExtension("replay");
    library.ScanFolder();

    REQUIRE(library.IsLoaded());
    REQUIRE(library.GetReplayCount() == 2);
    REQUIRE(library.GetReplays()[0].filename().string() == "a.REPLAY");
    REQUIRE(library.GetReplays()[1].filename().string() == "b.replay");

    library.Clear();
    REQUIRE_FALSE(library.IsLoaded());
    REQUIRE(library.GetReplayCount() == 0);
}

TEST_CASE("ProcessReplayFile extracts one file", "[library]")
{
    test::TempDir dir;
    auto path = dir.Write("one.replay", ReplayBody("Win", "solo#4242"));

    ReplayExtraction ex = ProcessReplayFile(path);
    REQUIRE(ex.error.empty());
    REQUIRE(ex.filename == "one.replay");
    REQUIRE(ex.segments.size() == 2);
    REQUIRE(ex.segments[0].value["details"]["m_endGameType"] == "Win");
    REQUIRE(ex.build_info.build == "1.0.5");
    REQUIRE(ex.build_info.branch == "live");
    REQUIRE(ex.players == std::vector<std::string>{ "solo#4242" });

    ReplayExtraction missing = ProcessReplayFile(dir.path() / "absent.replay");
    REQUIRE_FALSE(missing.found);
    REQUIRE(missing.error == "File not found");
}

TEST_CASE("ResolveWorkerCount clamps to the file count", "[batch]")
{
    REQUIRE(ResolveWorkerCount(8, 3) == 3);
    REQUIRE(ResolveWorkerCount(2, 10) == 2);
    REQUIRE(ResolveWorkerCount(0, 1) == 1);
    REQUIRE(ResolveWorkerCount(0, 0) >= 1);
}

TEST_CASE("RunReplayBatch output does not depend on the worker count", "[batch]")
{
    test::TempDir input;
    WriteReplays(input, 7);

    ReplayLibrary library;
    library.SetReplayFolder(input.path().string());
    library.ScanFolder();
    auto files = library.GetReplays();
    files.push_back(input.path() / "deleted.replay");

    test::TempDir output;
    auto runWith = [&](int workers, const std::string& name)
    {
        CorpusStore store(output.path() / name);
        BatchOptions options;
        options.worker_count = workers;
        auto progress = std::make_shared<BatchProgress>();
        BatchResult result = RunReplayBatch(files, store, options, progress);

        REQUIRE(result.store_ok);
        REQUIRE_FALSE(result.cancelled);
        REQUIRE(result.written == 8);
        REQUIRE(result.failed == 1);
        REQUIRE(progress->finished.load());
        REQUIRE(progress->files_done.load() == 8);
        return output.Read(name);
    };

    const std::string single = runWith(1, "single.json");
    const std::string pooled = runWith(4, "pooled.json");
    REQUIRE(single == pooled);

    StructuredValue doc = StructuredValue::parse(single);
    REQUIRE(doc["total_files"] == 8);
    REQUIRE(doc["processed_files"] == 8);
    REQUIRE(doc["results"]["deleted.replay"]["error"] == "File not found");

    auto it = doc["results"].begin();
    for (size_t i = 0; i < files.size(); i++, ++it)
        REQUIRE(it.key() == files[i].filename().string());
}

TEST_CASE("RunReplayBatch reruns produce an identical corpus", "[batch]")
{
    test::TempDir input;
    WriteReplays(input, 3);
    input.Write(std::string("09_canyon_assault_2025_02_01_10_00_00_") + "\xFF\xFE" + ".replay",
        ReplayBody("Win", "odd#5555"));

    ReplayLibrary library;
    library.SetReplayFolder(input.path().string());
    library.ScanFolder();
    REQUIRE(library.GetReplayCount() == 4);

    test::TempDir output;
    auto run = [&]()
    {
        CorpusStore store(output.path() / "corpus.json");
        auto progress = std::make_shared<BatchProgress>();
        BatchResult result = RunReplayBatch(library.GetReplays(), store, BatchOptions{}, progress);
        REQUIRE(result.store_ok);
        REQUIRE(result.written == 4);
        return output.Read("corpus.json");
    };

    const std::string first = run();
    const std::string second = run();
    REQUIRE(first == second);

    StructuredValue doc = StructuredValue::parse(second);
    REQUIRE(doc["processed_files"] == 4);
    REQUIRE(doc["results"].size() == 4);
    REQUIRE(doc["results"].contains("09_canyon_assault_2025_02_01_10_00_00_\xEF\xBF\xBD\xEF\xBF\xBD.replay"));
}

TEST_CASE("RunReplayBatch honours cancellation", "[batch]")
{
    test::TempDir input;
    WriteReplays(input, 5);

    ReplayLibrary library;
    library.SetReplayFolder(input.path().string());
    library.ScanFolder();

    test::TempDir output;
    CorpusStore store(output.path() / "corpus.json");
    auto progress = std::make_shared<BatchProgress>();
    progress->cancel_requested.store(true);

    BatchResult result = RunReplayBatch(library.GetReplays(), store, BatchOptions{}, progress);
    REQUIRE(result.cancelled);
    REQUIRE(result.store_ok);
    REQUIRE(result.written == 0);

    StructuredValue doc = StructuredValue::parse(output.Read("corpus.json"));
    REQUIRE(doc["total_files"] == 5);
    REQUIRE(doc["results"].empty());
}

TEST_CASE("RunReplayBatch with no files writes an empty corpus", "[batch]")
{
    test::TempDir output;
    CorpusStore store(output.path() / "corpus.json");
    auto progress = std::make_shared<BatchProgress>();

    BatchResult result = RunReplayBatch({}, store, BatchOptions{}, progress);
    REQUIRE(result.store_ok);
    REQUIRE(result.written == 0);
    REQUIRE(progress->finished.load());

    StructuredValue doc = StructuredValue::parse(output.Read("corpus.json"));
    REQUIRE(doc["total_files"] == 0);
    REQUIRE(doc["processed_files"] == 0);
}
