#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

/**
 * Receives (download id, bytes so far, total bytes if known).
 */
using ProgressCallback =
    std::function<void(const std::string &id, std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal)>;

/**
 * Receives the final notification of a Download.
 */
using DoneCallback = std::function<void(const std::string &id, bool success)>;

/**
 * Relays progress from all workers to the caller-supplied callbacks.
 *
 * Invocations are serialized by a mutex, so the callbacks never run
 * concurrently. Anything thrown by a callback is caught and logged; the
 * transfer that reported it carries on unaffected.
 *
 * The mutex is held while a callback runs: a callback must not call back
 * into the same reporter (report(), done(), callbackFaults() or the
 * setters), or it deadlocks.
 */
class ProgressReporter
{
public:
    ProgressReporter() = default;

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    void setCallback(ProgressCallback callback);
    void setDoneCallback(DoneCallback callback);

    void report(const std::string &id, std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal);
    void done(const std::string &id, bool success);

    /**
     * Number of exceptions thrown by callbacks so far.
     */
    std::uint64_t callbackFaults() const;

private:
    template <typename Invoke>
    void guarded(const std::string &id, Invoke &&invoke);

    mutable std::mutex mutex_;
    ProgressCallback callback_;
    DoneCallback doneCallback_;
    std::uint64_t faults_ = 0;
};

/**
 * Per-Download rate limiter in front of a ProgressReporter.
 * Owned by the worker running the Download, never shared.
 */
class ProgressThrottle
{
public:
    ProgressThrottle(ProgressReporter &reporter, std::string id, std::chrono::milliseconds interval);

    /**
     * Forward the update if it is the first one or `interval` has passed
     * since the last forwarded update.
     */
    void update(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal);

    /**
     * Forward the final count unless it was the last one forwarded.
     */
    void flush(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal);

    /**
     * Forget the last forwarded update, e.g. when a new attempt starts.
     */
    void restart();

private:
    void forward(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal);

    ProgressReporter &reporter_;
    std::string id_;
    std::chrono::milliseconds interval_;
    std::optional<std::chrono::steady_clock::time_point> lastForwarded_;
    std::uint64_t lastBytes_ = 0;
};
