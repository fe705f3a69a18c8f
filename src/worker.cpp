#include "worker.hpp"
#include "log.hpp"
#include "mirror_selector.hpp"

#include <exception>
#include <fstream>
#include <system_error>

#include <fmt/core.h>

namespace
{
    /**
     * Streams one attempt's body to the output file.
     * The file is opened (and truncated) when a successful response starts.
     */
    class FileSink : public TransferSink
    {
    public:
        FileSink(const std::filesystem::path &path, StreamVerifier &verifier, ProgressThrottle &throttle)
            : path_(path), verifier_(verifier), throttle_(throttle)
        {
        }

        bool begin(std::optional<std::uint64_t> contentLength) override
        {
            contentLength_ = contentLength;
            verifier_.reset();
            throttle_.restart();

            std::error_code ec;
            if (path_.has_parent_path())
            {
                std::filesystem::create_directories(path_.parent_path(), ec);
            }
            if (ec)
            {
                error_ = fmt::format("Failed to create directory for {}: {}", path_.string(), ec.message());
                return false;
            }

            // Existing files are overwritten, never appended to
            file_.open(path_, std::ios::binary | std::ios::trunc);
            if (!file_)
            {
                error_ = fmt::format("Cannot open file for writing: {}", path_.string());
                return false;
            }

            throttle_.update(0, contentLength_);
            return true;
        }

        bool write(const char *data, std::size_t length) override
        {
            file_.write(data, static_cast<std::streamsize>(length));
            if (!file_.good())
            {
                error_ = fmt::format("Failed to write to {}", path_.string());
                return false;
            }

            try
            {
                verifier_.update(data, length);
            }
            catch (const std::exception &e)
            {
                error_ = e.what();
                return false;
            }

            bytesWritten_ += length;
            throttle_.update(bytesWritten_, contentLength_);
            return true;
        }

        /**
         * Flush and close the file.
         *
         * @return false if buffered data could not be written
         */
        bool close()
        {
            if (!file_.is_open())
            {
                return true;
            }
            file_.close();
            if (file_.fail())
            {
                error_ = fmt::format("Failed to flush {}", path_.string());
                return false;
            }
            return true;
        }

        std::uint64_t bytesWritten() const { return bytesWritten_; }
        std::optional<std::uint64_t> contentLength() const { return contentLength_; }
        const std::string &error() const { return error_; }

    private:
        const std::filesystem::path &path_;
        StreamVerifier &verifier_;
        ProgressThrottle &throttle_;
        std::ofstream file_;
        std::optional<std::uint64_t> contentLength_;
        std::uint64_t bytesWritten_ = 0;
        std::string error_;
    };

    DownloadSummary cancelledSummary(DownloadSummary summary)
    {
        summary.status = DownloadSummary::Status::Failed;
        summary.failure = FailureReason{ErrorKind::Timeout, "Cancelled: global deadline exceeded", {}};
        return summary;
    }
}

DownloadWorker::DownloadWorker(const FetchConfig &config,
                               Transport &transport,
                               ProgressReporter &reporter,
                               const CancellationToken &cancel,
                               std::mt19937 &rng)
    : config_(config), transport_(transport), reporter_(reporter), cancel_(cancel), rng_(rng)
{
}

TransferRequest DownloadWorker::makeRequest(const std::string &url) const
{
    TransferRequest request;
    request.url = url;
    request.connectTimeout = config_.connectTimeout();
    request.timeout = config_.timeout();
    request.proxyMode = config_.proxyMode();
    request.proxyUrl = config_.proxyUrl();
    request.userAgent = config_.userAgent();
    return request;
}

DownloadSummary DownloadWorker::run(const Download &download)
{
    DownloadSummary summary;
    summary.id = download.id();
    summary.file = download.destinationPath(config_.destinationDir());

    RetryPolicy policy(config_.retryCount(), config_.backoff());
    MirrorSelector selector(download.mirrors(), policy, rng_, config_.shuffleMirrors());
    StreamVerifier verifier(download.expectedDigest());
    ProgressThrottle throttle(reporter_, download.id(), config_.progressInterval());

    std::vector<AttemptRecord> mirrorErrors;

    while (!selector.exhausted())
    {
        if (cancel_.cancelled())
        {
            summary = cancelledSummary(std::move(summary));
            reporter_.done(download.id(), false);
            return summary;
        }

        const std::string url = selector.currentMirror();
        const int attempt = selector.attempt();

        verifier.reset();
        FileSink sink(summary.file, verifier, throttle);
        TransferResult result = transport_.fetch(makeRequest(url), sink, cancel_);
        bool closed = sink.close();

        AttemptRecord record;
        record.url = url;
        record.attempt = attempt;
        record.httpStatus = result.httpStatus;
        record.error = result.error;
        record.message = result.message;
        bool retryable = result.retryable;

        if (result.error == ErrorKind::Io || (result.ok() && !closed))
        {
            record.error = ErrorKind::Io;
            record.message = sink.error().empty() ? result.message : sink.error();
        }
        else if (result.ok())
        {
            std::optional<std::uint64_t> expected = sink.contentLength();
            if (expected && sink.bytesWritten() != *expected)
            {
                record.error = ErrorKind::Network;
                record.message = fmt::format("Incomplete transfer: expected {} bytes but got {}",
                                             *expected, sink.bytesWritten());
                retryable = true;
            }
            else
            {
                bool matched = false;
                try
                {
                    matched = verifier.finish();
                }
                catch (const std::exception &e)
                {
                    record.error = ErrorKind::Io;
                    record.message = e.what();
                }

                if (record.error == ErrorKind::None && !matched)
                {
                    record.error = ErrorKind::Verification;
                    record.message = fmt::format("Digest mismatch: expected {} but got {}",
                                                 download.expectedDigest()->toString(),
                                                 verifier.actualHex());
                }
            }
        }

        summary.attempts.push_back(record);
        summary.bytesWritten = sink.bytesWritten();

        if (record.error == ErrorKind::None)
        {
            throttle.flush(sink.bytesWritten(), sink.contentLength());

            summary.status = DownloadSummary::Status::Success;
            summary.finalMirror = url;
            summary.verified = verifier.active();
            Log::info("{}: downloaded {} bytes from {}", download.id(), summary.bytesWritten, url);
            reporter_.done(download.id(), true);
            return summary;
        }

        RetryDecision decision = selector.onFailure(record.error, retryable);
        switch (decision)
        {
        case RetryDecision::RetrySameMirror:
        {
            auto delay = policy.delayBefore(attempt, rng_);
            Log::info("{}: attempt {}/{} on {} failed ({}), retrying in {}ms",
                      download.id(), attempt, policy.attemptsPerMirror(), url, record.message, delay.count());
            if (cancel_.waitFor(delay))
            {
                summary = cancelledSummary(std::move(summary));
                reporter_.done(download.id(), false);
                return summary;
            }
            break;
        }
        case RetryDecision::NextMirror:
            Log::info("{}: giving up on {} ({}), trying next mirror", download.id(), url, record.message);
            mirrorErrors.push_back(record);
            break;
        case RetryDecision::Exhausted:
            mirrorErrors.push_back(record);
            break;
        case RetryDecision::Abort:
            summary.status = DownloadSummary::Status::Failed;
            if (record.error == ErrorKind::Cancelled || record.error == ErrorKind::Timeout)
            {
                summary = cancelledSummary(std::move(summary));
            }
            else
            {
                summary.failure = FailureReason{record.error, record.message, {}};
                Log::warn("{}: {}", download.id(), record.message);
            }
            reporter_.done(download.id(), false);
            return summary;
        }
    }

    summary.status = DownloadSummary::Status::Failed;
    summary.verified = false;
    summary.failure = FailureReason{ErrorKind::AllMirrorsExhausted,
                                    fmt::format("All {} mirror(s) failed, last error: {}",
                                                mirrorErrors.size(), mirrorErrors.back().message),
                                    std::move(mirrorErrors)};
    Log::warn("{}: {}", download.id(), summary.failure->message);
    reporter_.done(download.id(), false);
    return summary;
}
