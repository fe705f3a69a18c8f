#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "config.hpp"
#include "errors.hpp"

/**
 * Shared stop flag for a batch. Workers poll it during transfers and
 * sleep on it between retries, so cancel() wakes every backoff wait.
 */
class CancellationToken
{
public:
    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    /**
     * Sleep for `duration` unless cancelled first.
     *
     * @return true if the token was cancelled (before or during the wait)
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
};

/**
 * Everything the transport needs to perform one GET request.
 */
struct TransferRequest
{
    std::string url;
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds timeout{300000};
    ProxyMode proxyMode = ProxyMode::System;
    std::string proxyUrl;
    std::string userAgent;
};

/**
 * Receives the body of a successful response as it streams in.
 * Bodies of error responses are never delivered.
 */
class TransferSink
{
public:
    virtual ~TransferSink() = default;

    /**
     * Called once before the first body byte (or at the end of an empty body).
     *
     * @param contentLength Value of Content-Length, if the server sent one
     * @return false to abort the transfer (reported as ErrorKind::Io)
     */
    virtual bool begin(std::optional<std::uint64_t> contentLength) = 0;

    /**
     * @return false to abort the transfer (reported as ErrorKind::Io)
     */
    virtual bool write(const char *data, std::size_t length) = 0;
};

/**
 * Outcome of one request.
 */
struct TransferResult
{
    ErrorKind error = ErrorKind::None; // None, Network, HttpStatus, Io or Cancelled
    bool retryable = false;            // meaningful for Network and HttpStatus
    long httpStatus = 0;               // 0 if no response was received
    std::optional<std::uint64_t> contentLength;
    std::uint64_t bytesReceived = 0;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }
};

/**
 * Performs a single HTTP(S) request and streams the body into a sink.
 * Implementations must be safe to call from several threads at once and
 * must return promptly with ErrorKind::Cancelled once the token is cancelled.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual TransferResult fetch(const TransferRequest &request,
                                 TransferSink &sink,
                                 const CancellationToken &cancel) = 0;
};
