#include "download.hpp"
#include "errors.hpp"
#include "url.hpp"

#include <fmt/core.h>

Download::Download(const std::string &url) : id_(url)
{
    addMirror(url);
}

Download::Download(const std::string &id, const std::vector<std::string> &mirrors) : id_(id)
{
    if (mirrors.empty())
    {
        throw ConfigError(fmt::format("Download '{}' has no mirror URL", id));
    }
    for (const auto &url : mirrors)
    {
        addMirror(url);
    }
}

Download &Download::addMirror(const std::string &url)
{
    if (url.empty())
    {
        throw ConfigError(fmt::format("Download '{}': mirror URL must not be empty", id_));
    }
    mirrors_.push_back(url);
    return *this;
}

Download &Download::destinationName(const std::filesystem::path &name)
{
    destinationOverride_ = name;
    return *this;
}

Download &Download::expectedDigest(const ExpectedDigest &digest)
{
    expectedDigest_ = digest;
    return *this;
}

Download &Download::expectedDigest(const std::string &checksum)
{
    expectedDigest_ = ChecksumVerifier::parseChecksum(checksum);
    return *this;
}

std::filesystem::path Download::destinationName() const
{
    if (destinationOverride_)
    {
        return *destinationOverride_;
    }
    return std::filesystem::path(urlFileName(mirrors_.front()));
}

std::filesystem::path Download::destinationPath(const std::filesystem::path &directory) const
{
    std::filesystem::path name = destinationName();
    if (name.empty())
    {
        return std::filesystem::path();
    }
    return (directory / name).lexically_normal();
}
