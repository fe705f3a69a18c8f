#include "scheduler.hpp"
#include "log.hpp"
#include "worker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <random>
#include <thread>

namespace
{
    /**
     * State shared by the worker threads of one run().
     */
    struct BatchState
    {
        explicit BatchState(const std::vector<Download> &downloads)
            : batch(downloads), summaries(downloads.size())
        {
            for (std::size_t i = 0; i < downloads.size(); ++i)
            {
                queue.push_back(i);
            }
        }

        const std::vector<Download> &batch;
        SummaryAggregator summaries;
        CancellationToken cancel;

        std::mutex queueMutex;
        std::deque<std::size_t> queue; // batch indices, FIFO

        std::atomic<int> active{0};
        std::atomic<int> peak{0};

        bool next(std::size_t &index)
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (queue.empty() || cancel.cancelled())
            {
                return false;
            }
            index = queue.front();
            queue.pop_front();
            return true;
        }
    };

    void enterSlot(BatchState &state)
    {
        int now = ++state.active;
        int peak = state.peak.load();
        while (now > peak && !state.peak.compare_exchange_weak(peak, now))
        {
        }
    }
}

Scheduler::Scheduler(const FetchConfig &config, Transport &transport, ProgressReporter &reporter)
    : config_(config), transport_(transport), reporter_(reporter)
{
}

std::vector<DownloadSummary> Scheduler::run(const std::vector<Download> &batch)
{
    peakActive_ = 0;
    if (batch.empty())
    {
        return {};
    }

    const auto start = std::chrono::steady_clock::now();
    BatchState state(batch);

    std::size_t workerCount = std::min<std::size_t>(static_cast<std::size_t>(config_.maxParallel()), batch.size());
    Log::debug("Running {} download(s) on {} worker(s)", batch.size(), workerCount);

    // One random engine per worker, seeded distinctly, so shuffling
    // mirrors needs no lock
    std::random_device rd;

    auto workerLoop = [this, &state](std::uint32_t seed)
    {
        std::seed_seq seq{seed};
        std::mt19937 rng(seq);
        DownloadWorker worker(config_, transport_, reporter_, state.cancel, rng);

        std::size_t index = 0;
        while (state.next(index))
        {
            const Download &download = state.batch[index];
            enterSlot(state);

            DownloadSummary summary;
            try
            {
                summary = worker.run(download);
            }
            catch (const std::exception &e)
            {
                Log::error("{}: unexpected failure: {}", download.id(), e.what());
                summary = DownloadSummary::failed(download.id(), ErrorKind::Io, e.what());
                summary.file = download.destinationPath(config_.destinationDir());
                reporter_.done(download.id(), false);
            }

            --state.active;
            state.summaries.record(index, std::move(summary));
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    try
    {
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            std::uint32_t seed = rd() ^ static_cast<std::uint32_t>(i * 0x9e3779b9u);
            workers.emplace_back(workerLoop, seed);
        }
    }
    catch (const std::exception &e)
    {
        Log::error("Failed to start worker threads: {}", e.what());
        state.cancel.cancel();
        for (auto &thread : workers)
        {
            thread.join();
        }
        throw;
    }

    if (config_.globalDeadline())
    {
        if (!state.summaries.waitUntil(start + *config_.globalDeadline()))
        {
            Log::warn("Global deadline of {}ms exceeded, cancelling {} unfinished download(s)",
                      config_.globalDeadline()->count(), batch.size() - state.summaries.completed());
            state.cancel.cancel();

            // Queued Downloads never get a slot
            std::lock_guard<std::mutex> lock(state.queueMutex);
            for (std::size_t index : state.queue)
            {
                DownloadSummary summary = DownloadSummary::failed(
                    batch[index].id(), ErrorKind::Timeout, "Not started: global deadline exceeded");
                summary.file = batch[index].destinationPath(config_.destinationDir());
                state.summaries.record(index, std::move(summary));
                reporter_.done(batch[index].id(), false);
            }
            state.queue.clear();
        }
    }

    for (auto &thread : workers)
    {
        thread.join();
    }

    peakActive_ = state.peak.load();
    return state.summaries.take();
}
