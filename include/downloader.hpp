#pragma once

#include <memory>
#include <vector>

#include "config.hpp"
#include "download.hpp"
#include "progress.hpp"
#include "summary.hpp"
#include "transport.hpp"

/**
 * Entry point of the library: owns the session configuration, the
 * transport and the progress reporter, and runs batches of Downloads.
 *
 * Example:
 *   Downloader downloader(FetchConfig::builder().destinationDir("/tmp/dl").build());
 *   downloader.onProgress([](const std::string &id, std::uint64_t done, std::optional<std::uint64_t> total) { ... });
 *   auto results = downloader.run({Download("https://example.com/file.iso")});
 */
class Downloader
{
public:
    /**
     * Use libcurl (HttpClient) as the transport.
     */
    explicit Downloader(FetchConfig config);

    /**
     * Use a caller-provided transport, which must outlive the Downloader.
     */
    Downloader(FetchConfig config, Transport &transport);

    Downloader(const Downloader &) = delete;
    Downloader &operator=(const Downloader &) = delete;

    /**
     * Register the progress callback. It may be invoked from any worker
     * thread, but never from two threads at once.
     */
    void onProgress(ProgressCallback callback);
    void onDone(DoneCallback callback);

    /**
     * Fetch every Download of the batch.
     *
     * @return One summary per Download, same length and order as `batch`
     * @throws ConfigError if the batch fails pre-flight validation:
     *         a mirror URL used by two Downloads, two Downloads writing the
     *         same file, or a Download without a usable file name
     */
    std::vector<DownloadSummary> run(const std::vector<Download> &batch);

    /**
     * Check a batch without running it.
     *
     * @throws ConfigError on the first problem found
     */
    void validate(const std::vector<Download> &batch) const;

    const FetchConfig &config() const { return config_; }
    ProgressReporter &reporter() { return reporter_; }

    /**
     * Slot usage peak of the last run, see Scheduler::peakActive().
     */
    int peakActive() const { return peakActive_; }

private:
    FetchConfig config_;
    std::unique_ptr<Transport> ownedTransport_;
    Transport &transport_;
    ProgressReporter reporter_;
    int peakActive_ = 0;
};
