#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "download.hpp"

/**
 * Build a Download from a mirror spec "url[,url...]" (`|` also separates).
 *
 * @throws ConfigError if no URL is given
 */
Download parseMirrorSpec(const std::string &spec);

/**
 * Parse a manifest: one Download per line,
 *
 *   url[,url...] [name=<file>] [digest=<algorithm:hex>]
 *
 * Blank lines and lines starting with '#' are skipped.
 *
 * @throws ConfigError naming the offending line
 */
std::vector<Download> parseManifest(std::istream &input);

/**
 * @throws ConfigError if the file cannot be opened or parsed
 */
std::vector<Download> loadManifest(const std::filesystem::path &path);
