#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "checksum.hpp"

/**
 * One logical file to fetch, described by one or more mirror URLs that are
 * believed to serve identical content.
 *
 * The mirror list is never empty: constructing a Download without a URL
 * throws ConfigError. Insertion order is the fallback order before
 * mirrors are shuffled.
 *
 * Example:
 *   Download iso("https://mirror-a.example/debian.iso");
 *   iso.addMirror("https://mirror-b.example/debian.iso")
 *      .expectedDigest("sha256:...");
 */
class Download
{
public:
    /**
     * @param url Primary mirror URL, also used as the id
     * @throws ConfigError if url is empty
     */
    explicit Download(const std::string &url);

    /**
     * @param id Caller-chosen id used for progress and result correlation
     * @param mirrors Mirror URLs in fallback order
     * @throws ConfigError if mirrors is empty or contains an empty URL
     */
    Download(const std::string &id, const std::vector<std::string> &mirrors);

    /**
     * @throws ConfigError if url is empty
     */
    Download &addMirror(const std::string &url);

    /**
     * Override the output file name. Relative names are resolved against the
     * destination directory, absolute names are used as they are.
     */
    Download &destinationName(const std::filesystem::path &name);

    Download &expectedDigest(const ExpectedDigest &digest);

    /**
     * @param checksum "algorithm:hexhash", e.g. "sha256:abc..."
     * @throws ConfigError if the checksum string is invalid
     */
    Download &expectedDigest(const std::string &checksum);

    const std::string &id() const { return id_; }
    const std::vector<std::string> &mirrors() const { return mirrors_; }
    const std::optional<ExpectedDigest> &expectedDigest() const { return expectedDigest_; }

    /**
     * The override if set, otherwise the last path segment of the first mirror.
     * Empty if neither yields a name.
     */
    std::filesystem::path destinationName() const;

    /**
     * Full output path inside the given directory.
     */
    std::filesystem::path destinationPath(const std::filesystem::path &directory) const;

private:
    std::string id_;
    std::vector<std::string> mirrors_;
    std::optional<std::filesystem::path> destinationOverride_;
    std::optional<ExpectedDigest> expectedDigest_;
};
