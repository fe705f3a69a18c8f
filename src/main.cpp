#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>

#include "downloader.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "log.hpp"
#include "manifest.hpp"

#ifndef MIRRORFETCH_VERSION
#define MIRRORFETCH_VERSION "0.0.0"
#endif

namespace
{
    /**
     * Command-line options, populated by the CLI11 parser.
     */
    struct CliOptions
    {
        std::vector<std::string> specs; // "url[,url...]" per Download
        std::string manifest;
        std::string outputDir = ".";
        int parallel = 4;
        int retryCount = 3;
        int connectTimeoutSeconds = 30;
        int timeoutSeconds = 300;
        int deadlineSeconds = 0; // 0 = no global deadline
        std::string backoff = "exponential";
        int backoffMs = 1000;
        std::string proxy = "system";
        bool noShuffle = false;
        std::optional<std::string> checksum; // only with a single Download
        bool verbose = false;
        bool quiet = false;
        bool showVersion = false;
    };

    /**
     * Prints one line per progress update. Updates arrive from several
     * workers but the reporter serializes them, so plain printing is safe.
     */
    class ConsoleProgress
    {
    public:
        void update(const std::string &id, std::uint64_t done, std::optional<std::uint64_t> total)
        {
            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_).count();

            if (total && *total > 0)
            {
                double percentage = (static_cast<double>(done) / static_cast<double>(*total)) * 100.0;
                fmt::print("{:<40} {:5.1f}% | {} / {} | {}\n", shorten(id), percentage,
                           formatBytes(done), formatBytes(*total), formatDuration(static_cast<long>(elapsed)));
            }
            else
            {
                fmt::print("{:<40} Downloaded: {} | Elapsed: {}\n", shorten(id), formatBytes(done),
                           formatDuration(static_cast<long>(elapsed)));
            }
            std::fflush(stdout);
        }

        void finished(const std::string &id, bool success)
        {
            fmt::print("{:<40} {}\n", shorten(id), success ? "done" : "FAILED");
        }

    private:
        static std::string shorten(const std::string &id)
        {
            constexpr std::size_t width = 40;
            if (id.size() <= width)
            {
                return id;
            }
            return "..." + id.substr(id.size() - (width - 3));
        }

        std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
    };

    FetchConfig buildConfig(const CliOptions &options)
    {
        BackoffPolicy backoff;
        backoff.kind = options.backoff == "fixed" ? BackoffPolicy::Kind::Fixed : BackoffPolicy::Kind::Exponential;
        backoff.initialDelay = std::chrono::milliseconds(options.backoffMs);
        backoff.maxDelay = std::max(backoff.maxDelay, backoff.initialDelay);

        FetchConfigBuilder builder = FetchConfig::builder();
        builder.destinationDir(options.outputDir)
            .maxParallel(options.parallel)
            .retryCount(options.retryCount)
            .connectTimeout(std::chrono::seconds(options.connectTimeoutSeconds))
            .timeout(std::chrono::seconds(options.timeoutSeconds))
            .backoff(backoff)
            .shuffleMirrors(!options.noShuffle);

        if (options.deadlineSeconds > 0)
        {
            builder.globalDeadline(std::chrono::seconds(options.deadlineSeconds));
        }

        if (options.proxy == "system")
        {
            builder.proxyMode(ProxyMode::System);
        }
        else if (options.proxy == "none")
        {
            builder.proxyMode(ProxyMode::None);
        }
        else
        {
            builder.proxy(options.proxy);
        }

        return builder.build();
    }

    std::vector<Download> buildBatch(const CliOptions &options)
    {
        std::vector<Download> batch;
        if (!options.manifest.empty())
        {
            batch = loadManifest(options.manifest);
        }
        for (const auto &spec : options.specs)
        {
            batch.push_back(parseMirrorSpec(spec));
        }

        if (batch.empty())
        {
            throw ConfigError("Nothing to download: give at least one URL or --manifest");
        }

        if (options.checksum)
        {
            if (batch.size() != 1)
            {
                throw ConfigError("--checksum applies to a single download, use a manifest for more");
            }
            batch.front().expectedDigest(*options.checksum);
        }
        return batch;
    }
}

int main(int argc, char *argv[])
{
    // Create CLI11 app
    CLI::App app{"mirrorfetch - concurrent downloads with mirror failover"};

    CliOptions options;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URLS", options.specs,
                   "Downloads to fetch, mirrors of one download separated by ','");

    app.add_option("-m,--manifest", options.manifest,
                   "File with one download per line: url[,url...] [name=FILE] [digest=ALGO:HEX]")
        ->check(CLI::ExistingFile);

    app.add_option("-o,--output-dir", options.outputDir, "Directory to download into")
        ->default_val(".");

    app.add_option("-j,--parallel", options.parallel, "Maximum concurrent downloads")
        ->check(CLI::PositiveNumber)
        ->default_val(4);

    app.add_option("-r,--retry-count,--max-retries", options.retryCount,
                   "Retries per mirror for transient errors")
        ->check(CLI::Range(0, 10))
        ->default_val(3);

    app.add_option("--connect-timeout", options.connectTimeoutSeconds, "Connect timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(30);

    app.add_option("-t,--timeout", options.timeoutSeconds, "Timeout in seconds for one request")
        ->check(CLI::PositiveNumber)
        ->default_val(300);

    app.add_option("--deadline", options.deadlineSeconds, "Deadline in seconds for the whole batch")
        ->check(CLI::NonNegativeNumber);

    app.add_option("--backoff", options.backoff, "Delay between same-mirror retries")
        ->check(CLI::IsMember({"fixed", "exponential"}))
        ->default_val("exponential");

    app.add_option("--backoff-ms", options.backoffMs, "Initial retry delay in milliseconds")
        ->check(CLI::NonNegativeNumber)
        ->default_val(1000);

    app.add_option("--proxy", options.proxy, "Proxy: 'system', 'none' or a proxy URL")
        ->default_val("system");

    app.add_flag("--no-shuffle", options.noShuffle, "Try mirrors in the given order");

    app.add_option("-c,--checksum", options.checksum,
                   "Expected checksum in format 'algorithm:hexhash' (e.g., sha256:abc123...)");

    app.add_flag("-v,--verbose", options.verbose, "Log retries and mirror changes");
    app.add_flag("-q,--quiet", options.quiet, "Only print the result table");
    app.add_flag("--version", options.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (options.showVersion)
    {
        fmt::print("mirrorfetch v{}\n", MIRRORFETCH_VERSION);
        fmt::print("Built with:\n");
        fmt::print("  - libcurl: {}\n", curl_version());
        fmt::print("  - OpenSSL: digest verification\n");
        fmt::print("  - CLI11: Command-line parsing\n");
        fmt::print("  - fmt: Modern string formatting\n");
        return 0;
    }

    if (options.verbose)
    {
        Log::setLevel(LogLevel::Info);
    }
    else if (options.quiet)
    {
        Log::setLevel(LogLevel::Error);
    }

    // ====================================================================
    // PERFORM DOWNLOADS
    // ====================================================================

    try
    {
        Downloader downloader(buildConfig(options));
        std::vector<Download> batch = buildBatch(options);

        ConsoleProgress console;
        if (!options.quiet)
        {
            downloader.onProgress([&console](const std::string &id, std::uint64_t done, std::optional<std::uint64_t> total)
                                  { console.update(id, done, total); });
            downloader.onDone([&console](const std::string &id, bool success)
                              { console.finished(id, success); });
        }

        std::vector<DownloadSummary> results = downloader.run(batch);

        fmt::print("\n");
        int failed = 0;
        for (std::size_t i = 0; i < results.size(); ++i)
        {
            const DownloadSummary &summary = results[i];
            fmt::print("{} {} -> {}\n    {}\n", summary.ok() ? "✓" : "✗", batch[i].id(),
                       summary.file.string(), summary.describe());
            if (!summary.ok())
            {
                ++failed;
            }
        }

        if (failed > 0)
        {
            fmt::print(stderr, "{} of {} download(s) failed\n", failed, results.size());
            return 1;
        }
        return 0;
    }
    catch (const ConfigError &e)
    {
        fmt::print(stderr, "✗ Invalid setup: {}\n", e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
