#pragma once

#include <string>
#include <vector>

#include "download.hpp"
#include "url.hpp"

/**
 * A set of base URLs that host the same tree, e.g. the mirrors of a
 * distribution archive. Per-file mirror lists are derived by resolving a
 * relative path against every base.
 */
class MirrorList
{
public:
    /**
     * @throws ConfigError if the list is empty or a base URL is malformed
     */
    explicit MirrorList(const std::vector<std::string> &baseUrls);

    /**
     * One URL per base, in base order.
     * "README.txt" against "http://ftp.us.debian.org/debian/"
     * gives "http://ftp.us.debian.org/debian/README.txt".
     */
    std::vector<std::string> urlsFor(const std::string &relativePath) const;

    /**
     * A Download for relativePath over all bases, with relativePath as its id.
     */
    Download downloadFor(const std::string &relativePath) const;

    std::size_t size() const { return bases_.size(); }

private:
    std::vector<UrlHandle> bases_;
};
