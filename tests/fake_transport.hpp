#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport.hpp"

/**
 * One scripted reply of the fake transport.
 */
struct FakeResponse
{
    enum class Kind
    {
        Body,         // 200 with `body`
        HttpError,    // `status` without body
        NetworkError, // connection-level failure
        Hang          // never answers until cancelled
    };

    Kind kind = Kind::Body;
    long status = 200;
    std::string body;
    bool retryable = true;
    std::chrono::milliseconds delay{0};
    std::optional<std::uint64_t> declaredLength; // Content-Length, defaults to body size
    bool sendLength = true;

    static FakeResponse ok(const std::string &body, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
    {
        FakeResponse response;
        response.body = body;
        response.delay = delay;
        return response;
    }

    static FakeResponse httpError(long status)
    {
        FakeResponse response;
        response.kind = Kind::HttpError;
        response.status = status;
        response.retryable = status >= 500;
        return response;
    }

    static FakeResponse networkError(bool retryable = true)
    {
        FakeResponse response;
        response.kind = Kind::NetworkError;
        response.status = 0;
        response.retryable = retryable;
        return response;
    }

    static FakeResponse hang()
    {
        FakeResponse response;
        response.kind = Kind::Hang;
        return response;
    }

    /**
     * Declares `declared` bytes but sends only `body`.
     */
    static FakeResponse truncated(const std::string &body, std::uint64_t declared)
    {
        FakeResponse response;
        response.body = body;
        response.declaredLength = declared;
        return response;
    }
};

/**
 * In-memory Transport replaying scripted responses per URL.
 * The last response of a script repeats forever. Unknown URLs get a 404.
 */
class FakeTransport : public Transport
{
public:
    void script(const std::string &url, std::vector<FakeResponse> responses)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[url] = Script{std::move(responses), 0};
    }

    TransferResult fetch(const TransferRequest &request, TransferSink &sink,
                         const CancellationToken &cancel) override
    {
        FakeResponse response = next(request.url);

        TransferResult result;
        if (cancel.cancelled())
        {
            result.error = ErrorKind::Cancelled;
            result.message = "Cancelled before start";
            leave();
            return result;
        }

        if (response.kind == FakeResponse::Kind::Hang)
        {
            // Wake up regularly in case the token is never cancelled
            while (!cancel.waitFor(std::chrono::milliseconds(50)))
            {
            }
            response.delay = std::chrono::milliseconds(0);
        }

        if (response.delay.count() > 0 && cancel.waitFor(response.delay))
        {
            result.error = ErrorKind::Cancelled;
            result.message = "Transfer cancelled";
            leave();
            return result;
        }
        if (cancel.cancelled())
        {
            result.error = ErrorKind::Cancelled;
            result.message = "Transfer cancelled";
            leave();
            return result;
        }

        switch (response.kind)
        {
        case FakeResponse::Kind::HttpError:
            result.error = ErrorKind::HttpStatus;
            result.httpStatus = response.status;
            result.retryable = response.retryable;
            result.message = "HTTP error " + std::to_string(response.status);
            leave();
            return result;
        case FakeResponse::Kind::NetworkError:
            result.error = ErrorKind::Network;
            result.retryable = response.retryable;
            result.message = response.retryable ? "Connection reset" : "URL using bad/illegal format";
            leave();
            return result;
        default:
            break;
        }

        result.httpStatus = 200;
        if (response.sendLength)
        {
            result.contentLength = response.declaredLength.value_or(response.body.size());
        }

        if (!sink.begin(result.contentLength))
        {
            result.error = ErrorKind::Io;
            result.message = "Failed to open output";
            leave();
            return result;
        }

        constexpr std::size_t chunk = 4096;
        for (std::size_t offset = 0; offset < response.body.size(); offset += chunk)
        {
            std::size_t length = std::min(chunk, response.body.size() - offset);
            if (!sink.write(response.body.data() + offset, length))
            {
                result.error = ErrorKind::Io;
                result.message = "Failed to write downloaded data";
                leave();
                return result;
            }
            result.bytesReceived += length;
        }

        leave();
        return result;
    }

    int peakConcurrent() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

    int requestCount(const std::string &url) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(log_.begin(), log_.end(), url));
    }

    std::vector<std::string> requestLog() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_;
    }

private:
    struct Script
    {
        std::vector<FakeResponse> responses;
        std::size_t position = 0;
    };

    FakeResponse next(const std::string &url)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(url);
        peak_ = std::max(peak_, ++inFlight_);

        auto it = scripts_.find(url);
        if (it == scripts_.end() || it->second.responses.empty())
        {
            return FakeResponse::httpError(404);
        }

        Script &script = it->second;
        std::size_t index = std::min(script.position, script.responses.size() - 1);
        ++script.position;
        return script.responses[index];
    }

    void leave()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --inFlight_;
    }

    mutable std::mutex mutex_;
    std::map<std::string, Script> scripts_;
    std::vector<std::string> log_;
    int inFlight_ = 0;
    int peak_ = 0;
};
