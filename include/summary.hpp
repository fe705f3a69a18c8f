#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

/**
 * One request made for a Download.
 */
struct AttemptRecord
{
    std::string url;
    int attempt = 1;     // 1-based, per mirror
    long httpStatus = 0; // 0 if no response was received
    ErrorKind error = ErrorKind::None;
    std::string message;
};

/**
 * Why a Download failed. For AllMirrorsExhausted, `mirrorErrors` holds the
 * last failed attempt of every mirror that was tried.
 */
struct FailureReason
{
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::vector<AttemptRecord> mirrorErrors;
};

/**
 * Terminal, immutable outcome of one Download.
 */
struct DownloadSummary
{
    enum class Status
    {
        Success,
        Failed
    };

    std::string id;
    Status status = Status::Failed;
    std::optional<FailureReason> failure;     // set iff status == Failed
    std::optional<std::string> finalMirror;   // URL that succeeded
    std::filesystem::path file;
    std::uint64_t bytesWritten = 0;
    bool verified = false;                    // only meaningful with an expected digest
    std::vector<AttemptRecord> attempts;

    bool ok() const { return status == Status::Success; }

    /**
     * One-line description, e.g. "ok (1.2 MB from http://...)" or the failure message.
     */
    std::string describe() const;

    static DownloadSummary failed(const std::string &id, ErrorKind kind, const std::string &message);
};

/**
 * Collects summaries by batch index as workers finish them, in any order.
 * take() returns them in batch order once every slot is filled.
 */
class SummaryAggregator
{
public:
    explicit SummaryAggregator(std::size_t count);

    /**
     * Store the summary for `index`. A slot is written at most once; later
     * records for the same index are ignored.
     *
     * @return true if the summary was stored
     */
    bool record(std::size_t index, DownloadSummary summary);

    bool has(std::size_t index) const;
    std::size_t completed() const;
    std::size_t size() const { return slots_.size(); }

    /**
     * Block until every slot is filled or `deadline` passes.
     *
     * @return true if complete
     */
    bool waitUntil(std::chrono::steady_clock::time_point deadline) const;

    void wait() const;

    /**
     * @throws std::logic_error if a slot is still empty
     */
    std::vector<DownloadSummary> take();

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
    std::vector<std::optional<DownloadSummary>> slots_;
    std::size_t completed_ = 0;
};
