#pragma once

#include <random>

#include "config.hpp"
#include "download.hpp"
#include "progress.hpp"
#include "summary.hpp"
#include "transport.hpp"

/**
 * Drives one Download through mirror failover, streaming each attempt to
 * disk while digesting and reporting progress.
 *
 * A worker is bound to one execution slot of the Scheduler and runs one
 * Download at a time. All attempt state lives inside run(), so nothing a
 * worker mutates is visible to other workers except through the
 * (internally synchronized) ProgressReporter.
 */
class DownloadWorker
{
public:
    DownloadWorker(const FetchConfig &config,
                   Transport &transport,
                   ProgressReporter &reporter,
                   const CancellationToken &cancel,
                   std::mt19937 &rng);

    /**
     * Fetch `download` into the destination directory.
     * Never throws for transfer or filesystem problems; they are reported
     * in the returned summary.
     */
    DownloadSummary run(const Download &download);

private:
    TransferRequest makeRequest(const std::string &url) const;

    const FetchConfig &config_;
    Transport &transport_;
    ProgressReporter &reporter_;
    const CancellationToken &cancel_;
    std::mt19937 &rng_;
};
