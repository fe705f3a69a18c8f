#include "config.hpp"
#include "errors.hpp"

#include <algorithm>
#include <system_error>
#include <unistd.h>

#include <fmt/core.h>

#ifndef MIRRORFETCH_VERSION
#define MIRRORFETCH_VERSION "0.0.0"
#endif

std::chrono::milliseconds BackoffPolicy::delayFor(int retry) const
{
    if (retry < 1)
    {
        return std::chrono::milliseconds(0);
    }

    std::chrono::milliseconds delay = initialDelay;
    if (kind == Kind::Exponential)
    {
        // Double per retry: 1s, 2s, 4s ... stop doubling once past the cap
        for (int i = 1; i < retry && delay < maxDelay; ++i)
        {
            delay *= 2;
        }
    }
    return std::min(delay, maxDelay);
}

FetchConfigBuilder FetchConfig::builder()
{
    return FetchConfigBuilder();
}

FetchConfigBuilder::FetchConfigBuilder()
{
    config_.userAgent_ = fmt::format("mirrorfetch/{}", MIRRORFETCH_VERSION);
}

FetchConfigBuilder &FetchConfigBuilder::maxParallel(int count)
{
    config_.maxParallel_ = count;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::retryCount(int count)
{
    config_.retryCount_ = count;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::connectTimeout(std::chrono::milliseconds timeout)
{
    config_.connectTimeout_ = timeout;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::timeout(std::chrono::milliseconds timeout)
{
    config_.timeout_ = timeout;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::destinationDir(const std::filesystem::path &dir)
{
    config_.destinationDir_ = dir;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::proxyMode(ProxyMode mode)
{
    config_.proxyMode_ = mode;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::proxy(const std::string &url)
{
    config_.proxyMode_ = ProxyMode::Explicit;
    config_.proxyUrl_ = url;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::userAgent(const std::string &agent)
{
    config_.userAgent_ = agent;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::backoff(const BackoffPolicy &policy)
{
    config_.backoff_ = policy;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::globalDeadline(std::chrono::milliseconds deadline)
{
    config_.globalDeadline_ = deadline;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::progressInterval(std::chrono::milliseconds interval)
{
    config_.progressInterval_ = interval;
    return *this;
}

FetchConfigBuilder &FetchConfigBuilder::shuffleMirrors(bool enabled)
{
    config_.shuffleMirrors_ = enabled;
    return *this;
}

FetchConfig FetchConfigBuilder::build() const
{
    if (config_.maxParallel_ < 1)
    {
        throw ConfigError(fmt::format("max_parallel must be at least 1, got {}", config_.maxParallel_));
    }
    if (config_.retryCount_ < 0)
    {
        throw ConfigError(fmt::format("retry_count must not be negative, got {}", config_.retryCount_));
    }
    if (config_.connectTimeout_.count() <= 0)
    {
        throw ConfigError("connect_timeout must be positive");
    }
    if (config_.timeout_.count() <= 0)
    {
        throw ConfigError("timeout must be positive");
    }
    if (config_.globalDeadline_ && config_.globalDeadline_->count() <= 0)
    {
        throw ConfigError("global deadline must be positive");
    }
    if (config_.progressInterval_.count() < 0)
    {
        throw ConfigError("progress interval must not be negative");
    }

    const BackoffPolicy &backoff = config_.backoff_;
    if (backoff.initialDelay.count() < 0 || backoff.maxDelay < backoff.initialDelay)
    {
        throw ConfigError(fmt::format("Invalid backoff delays: initial {}ms, max {}ms",
                                      backoff.initialDelay.count(), backoff.maxDelay.count()));
    }

    if (config_.proxyMode_ == ProxyMode::Explicit && config_.proxyUrl_.empty())
    {
        throw ConfigError("Explicit proxy mode requires a proxy URL");
    }

    if (config_.destinationDir_.empty())
    {
        throw ConfigError("Required destination directory was not set");
    }

    // Create all parent directories (like mkdir -p)
    std::error_code ec;
    std::filesystem::create_directories(config_.destinationDir_, ec);
    if (ec)
    {
        throw ConfigError(fmt::format("Failed to create destination directory {}: {}",
                                      config_.destinationDir_.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(config_.destinationDir_, ec))
    {
        throw ConfigError(fmt::format("Destination {} is not a directory",
                                      config_.destinationDir_.string()));
    }
    if (::access(config_.destinationDir_.c_str(), W_OK | X_OK) != 0)
    {
        throw ConfigError(fmt::format("Destination directory {} is not writable",
                                      config_.destinationDir_.string()));
    }

    FetchConfig config = config_;
    config.destinationDir_ = std::filesystem::absolute(config_.destinationDir_, ec);
    if (ec)
    {
        config.destinationDir_ = config_.destinationDir_;
    }
    return config;
}
