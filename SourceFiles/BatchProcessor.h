#pragma once
#include "CorpusStore.h"
#include "ReplayLibrary.h"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Shared between the workers, the writer and whoever watches the batch.
struct BatchProgress
{
    std::atomic<int>  files_done{ 0 };      // written to the corpus
    std::atomic<int>  files_total{ 0 };
    std::atomic<int>  files_failed{ 0 };
    std::atomic<bool> finished{ false };
    std::atomic<bool> has_error{ false };
    std::atomic<bool> cancel_requested{ false };

    std::mutex mutex;
    std::vector<std::string> errors;
};

struct BatchOptions
{
    int worker_count = 0;     // 0 = one per hardware thread
};

struct BatchResult
{
    int written = 0;          // records written, including error records
    int failed = 0;           // files recorded as errors
    bool cancelled = false;
    bool store_ok = true;     // false if the corpus could not be saved
};

int ResolveWorkerCount(int requested, size_t fileCount);

// Extracts every file on a pool of workers and applies the results to the
// store from the calling thread, in the order of files. Returns when all
// files are written, or early after cancellation or a store failure. The
// corpus on disk is a complete document at every point.
BatchResult RunReplayBatch(const std::vector<std::filesystem::path>& files,
                           CorpusStore& store,
                           const BatchOptions& options,
                           std::shared_ptr<BatchProgress> progress);
