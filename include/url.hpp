#pragma once

#include <string>

#include <curl/curl.h>

/**
 * RAII wrapper around libcurl's URL API (CURLU).
 * Parsing and relative resolution follow RFC 3986 as implemented by libcurl.
 */
class UrlHandle
{
public:
    /**
     * @throws ConfigError if the URL cannot be parsed
     */
    explicit UrlHandle(const std::string &url);
    ~UrlHandle();

    UrlHandle(const UrlHandle &other);
    UrlHandle &operator=(const UrlHandle &other);

    std::string str() const;
    std::string scheme() const;
    std::string host() const;

    /**
     * URL-decoded path, "/" when the URL has none.
     */
    std::string path() const;

    /**
     * Resolve a reference against this URL.
     * "pool/x.deb" against "http://host/debian/" gives "http://host/debian/pool/x.deb".
     *
     * @throws ConfigError if the result is not a valid URL
     */
    std::string join(const std::string &reference) const;

private:
    std::string part(CURLUPart which, unsigned int flags = 0) const;

    std::string url_;
    CURLU *handle_ = nullptr;
};

/**
 * Last path segment of a URL (decoded). Empty when the URL is malformed or its
 * path ends with '/'. Never throws.
 */
std::string urlFileName(const std::string &url);
