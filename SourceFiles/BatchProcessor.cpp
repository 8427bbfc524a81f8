#include "BatchProcessor.h"
#include "DebugLog.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <thread>

static const char* kLogTag = "batch";

namespace {

struct CompletedFile
{
    size_t index;
    ReplayExtraction extraction;
};

// Hand-off from the workers to the single writer.
struct ResultQueue
{
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<CompletedFile> items;
    int workers_running = 0;
};

void AddError(BatchProgress& progress, const std::string& message)
{
    std::lock_guard<std::mutex> lock(progress.mutex);
    progress.errors.push_back(message);
    progress.has_error.store(true);
}

bool ApplyExtraction(CorpusStore& store, const ReplayExtraction& ex, BatchProgress& progress, BatchResult& result)
{
    bool ok;
    if (!ex.error.empty())
    {
        DebugLog::Warning(kLogTag, ex.filename + ": " + ex.error);
        ok = store.RecordError(ex.filename, ex.error);
        result.failed++;
        progress.files_failed.fetch_add(1);
    }
    else
    {
        DebugLog::Debug(kLogTag, ex.filename + ": " + std::to_string(ex.segments.size()) +
            " segments, " + std::to_string(ex.players.size()) + " players");
        ok = store.Update(ex.filename, ex.segments, ex.build_info, ex.players);
    }

    if (!ok)
    {
        AddError(progress, "Saving " + ex.filename + " failed: " + store.GetLastError());
        return false;
    }

    result.written++;
    progress.files_done.fetch_add(1);
    return true;
}

} // anonymous namespace

int ResolveWorkerCount(int requested, size_t fileCount)
{
    int count = requested;
    if (count <= 0)
    {
        count = static_cast<int>(std::thread::hardware_concurrency());
        if (count <= 0) count = 1;
    }
    if (fileCount > 0 && static_cast<size_t>(count) > fileCount)
        count = static_cast<int>(fileCount);
    return count < 1 ? 1 : count;
}

BatchResult RunReplayBatch(const std::vector<std::filesystem::path>& files,
                           CorpusStore& store,
                           const BatchOptions& options,
                           std::shared_ptr<BatchProgress> progress)
{
    BatchResult result;
    progress->files_total.store(static_cast<int>(files.size()));

    if (!store.Initialize(static_cast<int>(files.size())))
    {
        AddError(*progress, "Cannot write corpus: " + store.GetLastError());
        result.store_ok = false;
        progress->finished.store(true);
        return result;
    }

    if (files.empty())
    {
        progress->finished.store(true);
        return result;
    }

    const int workerCount = ResolveWorkerCount(options.worker_count, files.size());
    DebugLog::Info(kLogTag, "Processing " + std::to_string(files.size()) + " replay files with " +
        std::to_string(workerCount) + " workers");

    ResultQueue queue;
    queue.workers_running = workerCount;
    std::atomic<size_t> nextFile{ 0 };
    std::atomic<bool> stopWorkers{ false };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (int w = 0; w < workerCount; w++)
    {
        workers.emplace_back([&files, &queue, &nextFile, &stopWorkers, progress]()
        {
            for (;;)
            {
                if (stopWorkers.load() || progress->cancel_requested.load()) break;
                size_t index = nextFile.fetch_add(1);
                if (index >= files.size()) break;

                ReplayExtraction ex;
                try
                {
                    ex = ProcessReplayFile(files[index]);
                }
                catch (const std::exception& e)
                {
                    ex = ReplayExtraction{};
                    ex.path = files[index];
                    ex.filename = ReplayRecordName(files[index]);
                    ex.error = std::string("Extraction failed: ") + e.what();
                }

                {
                    std::lock_guard<std::mutex> lock(queue.mutex);
                    queue.items.push_back({ index, std::move(ex) });
                }
                queue.ready.notify_one();
            }

            {
                std::lock_guard<std::mutex> lock(queue.mutex);
                queue.workers_running--;
            }
            queue.ready.notify_one();
        });
    }

    // Single writer. Results are reordered by file index so the corpus does
    // not depend on worker scheduling.
    std::map<size_t, ReplayExtraction> reorder;
    size_t nextToWrite = 0;
    bool storeFailed = false;

    for (;;)
    {
        bool workersDone = false;
        {
            std::unique_lock<std::mutex> lock(queue.mutex);
            queue.ready.wait_for(lock, std::chrono::milliseconds(100), [&queue]()
            {
                return !queue.items.empty() || queue.workers_running == 0;
            });
            while (!queue.items.empty())
            {
                CompletedFile done = std::move(queue.items.front());
                queue.items.pop_front();
                reorder.emplace(done.index, std::move(done.extraction));
            }
            workersDone = queue.workers_running == 0;
        }

        while (!storeFailed)
        {
            auto it = reorder.find(nextToWrite);
            if (it == reorder.end()) break;
            if (!ApplyExtraction(store, it->second, *progress, result))
            {
                storeFailed = true;
                stopWorkers.store(true);
                break;
            }
            reorder.erase(it);
            nextToWrite++;
        }

        if (workersDone || storeFailed) break;
    }

    for (auto& t : workers)
        t.join();

    // After a cancel the indices can have gaps; keep whatever finished.
    if (!storeFailed)
    {
        std::lock_guard<std::mutex> lock(queue.mutex);
        for (auto& done : queue.items)
            reorder.emplace(done.index, std::move(done.extraction));
        queue.items.clear();
    }
    for (auto& [index, ex] : reorder)
    {
        if (storeFailed) break;
        if (!ApplyExtraction(store, ex, *progress, result))
            storeFailed = true;
    }

    if (!store.Flush())
    {
        AddError(*progress, "Final corpus flush failed: " + store.GetLastError());
        storeFailed = true;
    }

    result.store_ok = !storeFailed;
    result.cancelled = progress->cancel_requested.load();
    if (result.cancelled)
        DebugLog::Warning(kLogTag, "Batch interrupted after " + std::to_string(result.written) + " of " +
            std::to_string(files.size()) + " files");

    progress->finished.store(true);
    return result;
}
