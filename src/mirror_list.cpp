#include "mirror_list.hpp"
#include "errors.hpp"

MirrorList::MirrorList(const std::vector<std::string> &baseUrls)
{
    if (baseUrls.empty())
    {
        throw ConfigError("Mirror list needs at least one base URL");
    }

    bases_.reserve(baseUrls.size());
    for (const auto &base : baseUrls)
    {
        bases_.emplace_back(base);
    }
}

std::vector<std::string> MirrorList::urlsFor(const std::string &relativePath) const
{
    std::vector<std::string> urls;
    urls.reserve(bases_.size());
    for (const auto &base : bases_)
    {
        urls.push_back(base.join(relativePath));
    }
    return urls;
}

Download MirrorList::downloadFor(const std::string &relativePath) const
{
    return Download(relativePath, urlsFor(relativePath));
}
