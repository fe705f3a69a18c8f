#include "manifest.hpp"
#include "errors.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/core.h>

Download parseMirrorSpec(const std::string &spec)
{
    std::vector<std::string> urls;
    std::string current;
    for (char ch : spec)
    {
        if (ch == ',' || ch == '|')
        {
            if (!current.empty())
                urls.push_back(current);
            current.clear();
        }
        else
        {
            current += ch;
        }
    }
    if (!current.empty())
        urls.push_back(current);

    if (urls.empty())
    {
        throw ConfigError(fmt::format("No URL found in '{}'", spec));
    }
    return Download(urls.front(), urls);
}

std::vector<Download> parseManifest(std::istream &input)
{
    std::vector<Download> downloads;
    std::string line;
    int lineNumber = 0;

    while (std::getline(input, line))
    {
        ++lineNumber;

        std::istringstream fields(line);
        std::string mirrors;
        if (!(fields >> mirrors) || mirrors.front() == '#')
        {
            continue;
        }

        try
        {
            Download download = parseMirrorSpec(mirrors);

            std::string field;
            while (fields >> field)
            {
                if (field.rfind("name=", 0) == 0)
                {
                    download.destinationName(field.substr(5));
                }
                else if (field.rfind("digest=", 0) == 0)
                {
                    download.expectedDigest(field.substr(7));
                }
                else
                {
                    throw ConfigError(fmt::format("Unknown field '{}'", field));
                }
            }
            downloads.push_back(std::move(download));
        }
        catch (const ConfigError &e)
        {
            throw ConfigError(fmt::format("Manifest line {}: {}", lineNumber, e.what()));
        }
    }

    return downloads;
}

std::vector<Download> loadManifest(const std::filesystem::path &path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw ConfigError(fmt::format("Cannot open manifest: {}", path.string()));
    }
    return parseManifest(file);
}
