#include "downloader.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "scheduler.hpp"

#include <set>
#include <string>
#include <utility>

#include <fmt/core.h>

Downloader::Downloader(FetchConfig config)
    : config_(std::move(config)),
      ownedTransport_(std::make_unique<HttpClient>()),
      transport_(*ownedTransport_)
{
}

Downloader::Downloader(FetchConfig config, Transport &transport)
    : config_(std::move(config)), transport_(transport)
{
}

void Downloader::onProgress(ProgressCallback callback)
{
    reporter_.setCallback(std::move(callback));
}

void Downloader::onDone(DoneCallback callback)
{
    reporter_.setDoneCallback(std::move(callback));
}

void Downloader::validate(const std::vector<Download> &batch) const
{
    std::set<std::string> knownUrls;
    std::set<std::filesystem::path> knownPaths;

    for (const auto &download : batch)
    {
        for (const auto &url : download.mirrors())
        {
            if (!knownUrls.insert(url).second)
            {
                throw ConfigError(fmt::format("Download URL \"{}\" is used more than once.", url));
            }
        }

        std::filesystem::path path = download.destinationPath(config_.destinationDir());
        if (path.empty() || !path.has_filename())
        {
            throw ConfigError(fmt::format("Download '{}': failed to get a file name, set one explicitly.",
                                          download.id()));
        }

        if (!knownPaths.insert(path).second)
        {
            throw ConfigError(fmt::format("Download file name \"{}\" is used more than once.", path.string()));
        }
    }
}

std::vector<DownloadSummary> Downloader::run(const std::vector<Download> &batch)
{
    validate(batch);

    Scheduler scheduler(config_, transport_, reporter_);
    std::vector<DownloadSummary> results = scheduler.run(batch);
    peakActive_ = scheduler.peakActive();

    std::size_t failed = 0;
    for (const auto &summary : results)
    {
        if (!summary.ok())
        {
            ++failed;
        }
    }
    Log::info("Batch finished: {} succeeded, {} failed", results.size() - failed, failed);

    return results;
}
