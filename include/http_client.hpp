#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <curl/curl.h>

#include "transport.hpp"

/**
 * Transport implementation on top of libcurl's easy interface.
 *
 * Each fetch() creates its own CURL handle, so one HttpClient can serve
 * every worker of a batch concurrently.
 */
class HttpClient : public Transport
{
public:
    HttpClient();
    ~HttpClient() override;

    // Delete copy operations (one client is shared by reference)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    /**
     * Perform a GET request and stream a successful body into `sink`.
     *
     * @param request URL, timeouts, proxy and user agent
     * @param sink Receives body bytes of 2xx responses
     * @param cancel Aborts the transfer from the progress callback when cancelled
     * @return Classified outcome, never throws for network failures
     */
    TransferResult fetch(const TransferRequest &request,
                         TransferSink &sink,
                         const CancellationToken &cancel) override;

    /**
     * Get human-readable HTTP status text for a status code.
     *
     * @param code HTTP status code (e.g., 200, 404, 500)
     * @return Descriptive text for the status code
     */
    static std::string getHttpStatusText(long code);

    /**
     * Whether a final HTTP status means the body is the requested file (2xx).
     */
    static bool isSuccessStatus(long code);

private:
    /**
     * Per-request state handed to the libcurl callbacks.
     */
    struct TransferContext
    {
        CURL *handle = nullptr;
        TransferSink *sink = nullptr;
        const CancellationToken *cancel = nullptr;
        bool started = false;     // sink.begin() was called
        bool discarding = false;  // non-2xx status, body is dropped
        bool sinkFailed = false;  // sink refused a write
        std::optional<std::uint64_t> contentLength;
        std::uint64_t received = 0;
    };

    /**
     * Error classification for retry logic.
     * Transient errors are temporary (network issues) and worth retrying.
     * Permanent errors are unrecoverable (404, invalid URL) and should fail immediately.
     */
    enum class ErrorType
    {
        Transient, // Temporary failure - retry might succeed
        Permanent, // Permanent failure - retrying won't help
        Unknown    // Uncertain - treat conservatively as transient
    };

    /**
     * Static callback for libcurl to write downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     *
     * @param ptr Pointer to downloaded data chunk
     * @param size Size of each element (usually 1)
     * @param nmemb Number of elements
     * @param userdata User-provided pointer (we pass TransferContext*)
     * @return Number of bytes consumed (size * nmemb on success)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static progress callback for libcurl, used only to observe cancellation.
     *
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    /**
     * Hand the response headers to the sink, once.
     */
    static bool startBody(TransferContext &context);

    /**
     * Final response code of an HTTP(S) transfer that is not 2xx, 0 otherwise
     * (success, no response yet, or a non-HTTP scheme such as file://).
     */
    static long failedHttpStatus(CURL *handle);

    static void applyOptions(CURL *handle, const TransferRequest &request, TransferContext &context);

    /**
     * Classify a CURL error to determine if retry is appropriate.
     *
     * @param code CURL error code from failed operation
     * @param httpCode HTTP status code (0 if no HTTP response received)
     * @return ErrorType indicating whether to retry
     */
    static ErrorType classifyError(CURLcode code, long httpCode);
};
