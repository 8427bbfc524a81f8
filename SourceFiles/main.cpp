#include "BatchProcessor.h"
#include "CorpusStore.h"
#include "DebugLog.h"
#include "ProgramConfig.h"
#include "ReplayLibrary.h"
#include "ReportFormatter.h"
#include "StatisticsAnalyzer.h"
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static const char* kLogTag = "main";

enum ExitCode
{
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

static std::atomic<BatchProgress*> g_activeBatch{ nullptr };

static void OnInterrupt(int)
{
    BatchProgress* progress = g_activeBatch.load();
    if (progress)
        progress->cancel_requested.store(true);
}

static void PrintUsage()
{
    fputs(
        "usage:\n"
        "  replay_corpus build <replay_dir> [--corpus FILE] [--jobs N] [--flush-every N] [--fresh] [--config FILE]\n"
        "  replay_corpus report [--corpus FILE] [--json] [--output FILE] [--config FILE]\n"
        "  replay_corpus inspect <file>\n"
        "  replay_corpus players <file>\n"
        "  replay_corpus strings <file> [--min-length N]\n"
        "\n"
        "global options: --config FILE, --log-level debug|info|warning|error\n",
        stderr);
}

struct CommandLine
{
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> config_path;
    std::optional<std::string> corpus_path;
    std::optional<std::string> output_path;
    std::optional<std::string> log_level;
    std::optional<int> jobs;
    std::optional<int> flush_every;
    std::optional<int> min_length;
    bool fresh = false;
    bool json = false;
};

static bool ParseInt(const std::string& text, int minValue, int& out)
{
    if (text.empty() || text.size() > 9) return false;
    int value = 0;
    for (char c : text)
    {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    if (value < minValue) return false;
    out = value;
    return true;
}

static bool ParseCommandLine(int argc, char** argv, CommandLine& cl, std::string& error)
{
    if (argc < 2)
    {
        error = "missing command";
        return false;
    }
    cl.command = argv[1];

    for (int i = 2; i < argc; i++)
    {
        std::string arg = argv[i];
        auto needValue = [&](std::string& value) -> bool
        {
            if (i + 1 >= argc)
            {
                error = arg + " needs a value";
                return false;
            }
            value = argv[++i];
            return true;
        };
        auto needInt = [&](int minValue, std::optional<int>& out) -> bool
        {
            std::string value;
            if (!needValue(value)) return false;
            int parsed = 0;
            if (!ParseInt(value, minValue, parsed))
            {
                error = arg + " expects an integer >= " + std::to_string(minValue);
                return false;
            }
            out = parsed;
            return true;
        };

        std::string value;
        if (arg == "--config")
        {
            if (!needValue(value)) return false;
            cl.config_path = value;
        }
        else if (arg == "--corpus")
        {
            if (!needValue(value)) return false;
            cl.corpus_path = value;
        }
        else if (arg == "--output")
        {
            if (!needValue(value)) return false;
            cl.output_path = value;
        }
        else if (arg == "--log-level")
        {
            if (!needValue(value)) return false;
            cl.log_level = value;
        }
        else if (arg == "--jobs")
        {
            if (!needInt(0, cl.jobs)) return false;
        }
        else if (arg == "--flush-every")
        {
            if (!needInt(1, cl.flush_every)) return false;
        }
        else if (arg == "--min-length")
        {
            if (!needInt(1, cl.min_length)) return false;
        }
        else if (arg == "--fresh")
        {
            cl.fresh = true;
        }
        else if (arg == "--json")
        {
            cl.json = true;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            error = "unknown option " + arg;
            return false;
        }
        else
        {
            cl.positional.push_back(arg);
        }
    }
    return true;
}

// Config file, then command-line overrides.
static bool ResolveConfig(const CommandLine& cl, ProgramConfig& cfg, std::string& error)
{
    if (cl.config_path)
    {
        if (!LoadProgramConfig(*cl.config_path, cfg, error)) return false;
    }
    else
    {
        std::error_code ec;
        if (std::filesystem::exists(kDefaultConfigFile, ec) &&
            !LoadProgramConfig(kDefaultConfigFile, cfg, error))
            return false;
    }

    if (cl.corpus_path) cfg.corpus_path = *cl.corpus_path;
    if (cl.jobs) cfg.worker_count = *cl.jobs;
    if (cl.flush_every) cfg.flush_interval = *cl.flush_every;
    if (cl.log_level && !ParseLogLevel(*cl.log_level, cfg.log_level))
    {
        error = "unknown log level '" + *cl.log_level + "'";
        return false;
    }
    return true;
}

static bool ReadInputFile(const CommandLine& cl, std::vector<uint8_t>& buffer)
{
    if (cl.positional.size() != 1)
    {
        PrintUsage();
        return false;
    }
    std::string error;
    if (!ReadReplayBytes(cl.positional[0], buffer, error))
    {
        DebugLog::Error(kLogTag, error);
        return false;
    }
    return true;
}

static int RunBuild(const CommandLine& cl, const ProgramConfig& cfg)
{
    std::string folder = cfg.replays_folder;
    if (!cl.positional.empty()) folder = cl.positional[0];
    if (folder.empty() || cl.positional.size() > 1)
    {
        PrintUsage();
        return kExitUsage;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec))
    {
        DebugLog::Error(kLogTag, "Not a directory: " + folder);
        return kExitFailure;
    }

    ReplayLibrary library;
    library.SetReplayFolder(folder);
    library.SetExtension(cfg.replay_extension);
    library.ScanFolder();

    CorpusStore store(cfg.corpus_path, cfg.flush_interval);
    if (cl.fresh && !store.Reset())
    {
        DebugLog::Error(kLogTag, "Cannot reset corpus: " + store.GetLastError());
        return kExitFailure;
    }

    auto progress = std::make_shared<BatchProgress>();
    g_activeBatch.store(progress.get());
    std::signal(SIGINT, OnInterrupt);

    BatchOptions options;
    options.worker_count = cfg.worker_count;
    BatchResult result = RunReplayBatch(library.GetReplays(), store, options, progress);

    std::signal(SIGINT, SIG_DFL);
    g_activeBatch.store(nullptr);

    {
        std::lock_guard<std::mutex> lock(progress->mutex);
        for (const auto& error : progress->errors)
            DebugLog::Error(kLogTag, error);
    }

    printf("Processed %d/%d files (%d failed) into %s\n",
        result.written, library.GetReplayCount(), result.failed, cfg.corpus_path.c_str());

    if (!result.store_ok) return kExitFailure;
    if (result.cancelled) return kExitFailure;
    return kExitOk;
}

static int RunReport(const CommandLine& cl, const ProgramConfig& cfg)
{
    if (!cl.positional.empty())
    {
        PrintUsage();
        return kExitUsage;
    }

    Corpus corpus;
    CorpusLoadResult load = CorpusStore::LoadCorpus(cfg.corpus_path, corpus);
    if (load.status == CorpusLoadStatus::Missing)
    {
        DebugLog::Error(kLogTag, "Corpus not found: " + cfg.corpus_path);
        return kExitFailure;
    }
    if (load.status == CorpusLoadStatus::Recovered)
    {
        DebugLog::Error(kLogTag, "Corpus is unreadable: " + load.warning);
        return kExitFailure;
    }

    StatisticsReport report = AnalyzeCorpus(corpus, cfg.report);
    std::string text = cl.json
        ? ReportToJson(report).dump(2, ' ', false, StructuredValue::error_handler_t::replace) + "\n"
        : FormatReportText(report, cfg.report);

    if (cl.output_path)
    {
        std::ofstream out(*cl.output_path, std::ios::binary | std::ios::trunc);
        out << text;
        if (!out)
        {
            DebugLog::Error(kLogTag, "Cannot write " + *cl.output_path);
            return kExitFailure;
        }
        DebugLog::Info(kLogTag, "Report written to " + *cl.output_path);
        return kExitOk;
    }

    fputs(text.c_str(), stdout);
    return kExitOk;
}

static int RunInspect(const CommandLine& cl)
{
    std::vector<uint8_t> buffer;
    if (!ReadInputFile(cl, buffer)) return kExitFailure;

    std::vector<Segment> segments = ScanSegments(buffer);
    printf("%s: %zu bytes, %zu segments\n", cl.positional[0].c_str(), buffer.size(), segments.size());
    for (const auto& seg : segments)
    {
        printf("[%zu..%zu] %s\n", seg.start, seg.end,
            seg.value.dump(-1, ' ', false, StructuredValue::error_handler_t::replace).c_str());
    }

    BuildInfo build = ExtractBuildInfo(buffer);
    printf("build: %s\nbranch: %s\n",
        build.build ? build.build->c_str() : "(none)",
        build.branch ? build.branch->c_str() : "(none)");

    std::vector<CompressedChunk> chunks = ScanZlibChunks(buffer);
    printf("%zu compressed chunks\n", chunks.size());
    for (const auto& chunk : chunks)
    {
        printf("[%zu..%zu) %zu bytes inflated\n", chunk.start, chunk.end, chunk.data.size());
        for (const auto& s : ExtractPrintableStrings(chunk.data, 8))
            printf("  %s\n", s.c_str());
    }
    return kExitOk;
}

static int RunPlayers(const CommandLine& cl)
{
    std::vector<uint8_t> buffer;
    if (!ReadInputFile(cl, buffer)) return kExitFailure;

    for (const auto& name : ExtractPlayerNames(buffer))
        printf("%s\n", name.c_str());
    return kExitOk;
}

static int RunStrings(const CommandLine& cl)
{
    std::vector<uint8_t> buffer;
    if (!ReadInputFile(cl, buffer)) return kExitFailure;

    size_t minLength = cl.min_length ? static_cast<size_t>(*cl.min_length) : 4;
    for (const auto& s : ExtractPrintableStrings(buffer, minLength))
        printf("%s\n", s.c_str());
    return kExitOk;
}

int main(int argc, char** argv)
{
    CommandLine cl;
    std::string error;
    if (!ParseCommandLine(argc, argv, cl, error))
    {
        fprintf(stderr, "error: %s\n", error.c_str());
        PrintUsage();
        return kExitUsage;
    }

    if (cl.command == "help" || cl.command == "--help" || cl.command == "-h")
    {
        PrintUsage();
        return kExitOk;
    }

    ProgramConfig cfg;
    if (!ResolveConfig(cl, cfg, error))
    {
        fprintf(stderr, "error: %s\n", error.c_str());
        return kExitUsage;
    }
    DebugLog::SetMinLevel(cfg.log_level);

    try
    {
        if (cl.command == "build")   return RunBuild(cl, cfg);
        if (cl.command == "report")  return RunReport(cl, cfg);
        if (cl.command == "inspect") return RunInspect(cl);
        if (cl.command == "players") return RunPlayers(cl);
        if (cl.command == "strings") return RunStrings(cl);
    }
    catch (const std::exception& e)
    {
        DebugLog::Error(kLogTag, std::string("Unhandled error: ") + e.what());
        return kExitFailure;
    }

    fprintf(stderr, "error: unknown command '%s'\n", cl.command.c_str());
    PrintUsage();
    return kExitUsage;
}
