#pragma once

#include <atomic>
#include <vector>

#include "config.hpp"
#include "download.hpp"
#include "progress.hpp"
#include "summary.hpp"
#include "transport.hpp"

/**
 * Runs a batch of Downloads over a fixed number of worker slots.
 *
 * Exactly min(maxParallel, batch size) worker threads are started. Each
 * takes the oldest queued Download, runs it to a terminal summary and then
 * takes the next one, so a freed slot goes to the first waiter (FIFO).
 * Failed Downloads never stop the batch.
 *
 * With a global deadline, expiry cancels in-flight Downloads and marks
 * queued ones as failed without starting them.
 */
class Scheduler
{
public:
    Scheduler(const FetchConfig &config, Transport &transport, ProgressReporter &reporter);

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    /**
     * @return One summary per Download, in batch order
     */
    std::vector<DownloadSummary> run(const std::vector<Download> &batch);

    /**
     * Highest number of Downloads that held a slot at the same time
     * during the last run().
     */
    int peakActive() const { return peakActive_.load(); }

private:
    const FetchConfig &config_;
    Transport &transport_;
    ProgressReporter &reporter_;
    std::atomic<int> peakActive_{0};
};
