#pragma once

#include <stdexcept>
#include <string>

/**
 * Thrown when a configuration, a Download or a batch is invalid.
 * Always raised before any transfer starts.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Error classes reported for a single attempt or a whole Download.
 */
enum class ErrorKind
{
    None,
    Network,             // connect, timeout, reset, short body
    HttpStatus,          // non-success response code
    Io,                  // local filesystem failure, fatal for the Download
    Verification,        // digest mismatch after a complete transfer
    Cancelled,           // transfer interrupted by the cancellation token
    Timeout,             // global deadline expired
    AllMirrorsExhausted  // every mirror failed
};

/**
 * Short lowercase name used in logs and result tables.
 */
const char *errorKindName(ErrorKind kind);
