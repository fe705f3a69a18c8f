#include "url.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

UrlHandle::UrlHandle(const std::string &url) : url_(url), handle_(curl_url())
{
    if (!handle_)
    {
        throw std::runtime_error("Could not initiate URL parser.");
    }

    CURLUcode uc = curl_url_set(handle_, CURLUPART_URL, url.c_str(), 0);
    if (uc != CURLUE_OK)
    {
        curl_url_cleanup(handle_);
        handle_ = nullptr;
        throw ConfigError(fmt::format("Malformed URL '{}' (code {})", url, static_cast<int>(uc)));
    }
}

UrlHandle::~UrlHandle()
{
    if (handle_)
        curl_url_cleanup(handle_);
}

UrlHandle::UrlHandle(const UrlHandle &other) : url_(other.url_), handle_(curl_url_dup(other.handle_))
{
    if (!handle_)
    {
        throw std::runtime_error("Could not copy URL handle.");
    }
}

UrlHandle &UrlHandle::operator=(const UrlHandle &other)
{
    if (this != &other)
    {
        UrlHandle tmp(other);
        std::swap(url_, tmp.url_);
        std::swap(handle_, tmp.handle_);
    }
    return *this;
}

std::string UrlHandle::part(CURLUPart which, unsigned int flags) const
{
    char *value = nullptr;
    CURLUcode uc = curl_url_get(handle_, which, &value, flags);
    if (uc != CURLUE_OK || !value)
    {
        return std::string();
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string UrlHandle::str() const
{
    return part(CURLUPART_URL);
}

std::string UrlHandle::scheme() const
{
    return part(CURLUPART_SCHEME);
}

std::string UrlHandle::host() const
{
    return part(CURLUPART_HOST);
}

std::string UrlHandle::path() const
{
    std::string result = part(CURLUPART_PATH, CURLU_URLDECODE);
    return result.empty() ? "/" : result;
}

std::string UrlHandle::join(const std::string &reference) const
{
    UrlHandle joined(*this);

    // Setting a relative URL on a handle that holds a full one resolves it
    CURLUcode uc = curl_url_set(joined.handle_, CURLUPART_URL, reference.c_str(), 0);
    if (uc != CURLUE_OK)
    {
        throw ConfigError(fmt::format("Cannot resolve '{}' against '{}' (code {})",
                                      reference, url_, static_cast<int>(uc)));
    }
    return joined.str();
}

std::string urlFileName(const std::string &url)
{
    CURLU *handle = curl_url();
    if (!handle)
    {
        return std::string();
    }

    std::string result;
    char *path = nullptr;
    if (curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK &&
        curl_url_get(handle, CURLUPART_PATH, &path, CURLU_URLDECODE) == CURLUE_OK && path)
    {
        std::string full(path);
        curl_free(path);

        // "http://host/dir/" has an empty last segment and yields no name
        std::size_t slash = full.find_last_of('/');
        result = (slash == std::string::npos) ? full : full.substr(slash + 1);
    }
    curl_url_cleanup(handle);
    return result;
}
