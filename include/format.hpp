#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.3 MB")
 *
 * @param bytes Number of bytes
 * @return Formatted string
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 *
 * @param seconds Duration in seconds, negative means unknown
 * @return Formatted string
 */
std::string formatDuration(long seconds);
