#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

/**
 * How the transport should pick a proxy.
 */
enum class ProxyMode
{
    System,  // honor http_proxy / https_proxy / no_proxy from the environment
    None,    // connect directly, ignore the environment
    Explicit // use FetchConfig::proxyUrl()
};

/**
 * Delay policy between two attempts against the same mirror.
 */
struct BackoffPolicy
{
    enum class Kind
    {
        Fixed,
        Exponential
    };

    Kind kind = Kind::Exponential;
    std::chrono::milliseconds initialDelay{1000}; // 1 second
    std::chrono::milliseconds maxDelay{30000};
    bool jitter = true; // +/-20% random variation

    /**
     * Delay before same-mirror retry number `retry` (1-based), without jitter.
     */
    std::chrono::milliseconds delayFor(int retry) const;
};

class FetchConfigBuilder;

/**
 * Immutable session settings for the download orchestrator.
 * Only FetchConfigBuilder::build() can produce one, so every instance is valid.
 */
class FetchConfig
{
public:
    static FetchConfigBuilder builder();

    int maxParallel() const { return maxParallel_; }
    int retryCount() const { return retryCount_; }
    std::chrono::milliseconds connectTimeout() const { return connectTimeout_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    const std::filesystem::path &destinationDir() const { return destinationDir_; }
    ProxyMode proxyMode() const { return proxyMode_; }
    const std::string &proxyUrl() const { return proxyUrl_; }
    const std::string &userAgent() const { return userAgent_; }
    const BackoffPolicy &backoff() const { return backoff_; }
    std::optional<std::chrono::milliseconds> globalDeadline() const { return globalDeadline_; }
    std::chrono::milliseconds progressInterval() const { return progressInterval_; }
    bool shuffleMirrors() const { return shuffleMirrors_; }

private:
    friend class FetchConfigBuilder;
    FetchConfig() = default;

    int maxParallel_ = 4;
    int retryCount_ = 3;
    std::chrono::milliseconds connectTimeout_{30000};
    std::chrono::milliseconds timeout_{300000}; // 5 minutes per request
    std::filesystem::path destinationDir_;
    ProxyMode proxyMode_ = ProxyMode::System;
    std::string proxyUrl_;
    std::string userAgent_;
    BackoffPolicy backoff_;
    std::optional<std::chrono::milliseconds> globalDeadline_;
    std::chrono::milliseconds progressInterval_{200}; // at most 5 updates per second
    bool shuffleMirrors_ = true;
};

/**
 * Collects settings and validates them all at once in build().
 *
 * Example:
 *   auto config = FetchConfig::builder()
 *                     .destinationDir("/tmp/downloads")
 *                     .maxParallel(8)
 *                     .build();
 */
class FetchConfigBuilder
{
public:
    FetchConfigBuilder();

    FetchConfigBuilder &maxParallel(int count);
    FetchConfigBuilder &retryCount(int count);
    FetchConfigBuilder &connectTimeout(std::chrono::milliseconds timeout);
    FetchConfigBuilder &timeout(std::chrono::milliseconds timeout);
    FetchConfigBuilder &destinationDir(const std::filesystem::path &dir);
    FetchConfigBuilder &proxyMode(ProxyMode mode);

    /**
     * Shortcut for proxyMode(ProxyMode::Explicit) with the given proxy URL.
     */
    FetchConfigBuilder &proxy(const std::string &url);
    FetchConfigBuilder &userAgent(const std::string &agent);
    FetchConfigBuilder &backoff(const BackoffPolicy &policy);
    FetchConfigBuilder &globalDeadline(std::chrono::milliseconds deadline);
    FetchConfigBuilder &progressInterval(std::chrono::milliseconds interval);
    FetchConfigBuilder &shuffleMirrors(bool enabled);

    /**
     * Validate the collected settings and produce a FetchConfig.
     * Creates the destination directory (recursively) if it does not exist.
     *
     * @return The immutable configuration
     * @throws ConfigError if any setting is invalid or the directory is not writable
     */
    FetchConfig build() const;

private:
    FetchConfig config_;
};
