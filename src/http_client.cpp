#include "http_client.hpp"
#include "log.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <strings.h>

#include <fmt/core.h>

HttpClient::HttpClient()
{
    // curl_global_init is not thread-safe, run it exactly once per process
    static std::once_flag initFlag;
    static CURLcode initResult = CURLE_OK;
    std::call_once(initFlag, []
                   { initResult = curl_global_init(CURL_GLOBAL_DEFAULT); });

    if (initResult != CURLE_OK)
    {
        throw std::runtime_error(
            fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(initResult)));
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::startBody(TransferContext &context)
{
    if (context.started)
    {
        return true;
    }
    context.started = true;

    curl_off_t contentLength = -1;
    if (curl_easy_getinfo(context.handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength) == CURLE_OK &&
        contentLength >= 0)
    {
        context.contentLength = static_cast<std::uint64_t>(contentLength);
    }

    if (!context.sink->begin(context.contentLength))
    {
        context.sinkFailed = true;
        return false;
    }
    return true;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *context = static_cast<TransferContext *>(userdata);

    if (!context->started && !context->discarding)
    {
        if (failedHttpStatus(context->handle) != 0)
        {
            // Error page or unfollowed redirect, not the file: never hand it to the sink
            context->discarding = true;
        }
        else if (!startBody(*context))
        {
            return 0; // Abort transfer, libcurl reports CURLE_WRITE_ERROR
        }
    }

    if (context->discarding)
    {
        return totalSize;
    }

    if (!context->sink->write(ptr, totalSize))
    {
        context->sinkFailed = true;
        return 0;
    }

    context->received += totalSize;

    // If we return 0 or a different value, libcurl aborts the transfer
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<TransferContext *>(clientp);
    return context->cancel->cancelled() ? 1 : 0;
}

void HttpClient::applyOptions(CURL *handle, const TransferRequest &request, TransferContext &context)
{
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(handle, CURLOPT_USERAGENT, request.userAgent.c_str());

    // Worker threads must not get signals from libcurl's resolver timeouts
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);

    // HTTPS settings (CRITICAL for security)
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

    // Follow HTTP redirects, limit the chain
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

    switch (request.proxyMode)
    {
    case ProxyMode::System:
        // libcurl reads http_proxy, https_proxy and no_proxy by itself
        break;
    case ProxyMode::None:
        curl_easy_setopt(handle, CURLOPT_PROXY, "");
        curl_easy_setopt(handle, CURLOPT_NOPROXY, "*");
        break;
    case ProxyMode::Explicit:
        curl_easy_setopt(handle, CURLOPT_PROXY, request.proxyUrl.c_str());
        break;
    }

    // The progress callback is where cancellation is observed
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &context);
}

TransferResult HttpClient::fetch(const TransferRequest &request,
                                 TransferSink &sink,
                                 const CancellationToken &cancel)
{
    TransferResult result;

    if (cancel.cancelled())
    {
        result.error = ErrorKind::Cancelled;
        result.message = "Cancelled before start";
        return result;
    }

    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        result.error = ErrorKind::Network;
        result.message = "Failed to initialize CURL (out of memory or library error)";
        return result;
    }

    TransferContext context;
    context.handle = curl.get();
    context.sink = &sink;
    context.cancel = &cancel;

    applyOptions(curl.get(), request, context);

    Log::debug("GET {}", request.url);
    CURLcode res = curl_easy_perform(curl.get());

    long httpCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    result.httpStatus = httpCode;
    result.bytesReceived = context.received;
    result.contentLength = context.contentLength;

    if (res == CURLE_ABORTED_BY_CALLBACK && cancel.cancelled())
    {
        result.error = ErrorKind::Cancelled;
        result.message = "Transfer cancelled";
        return result;
    }

    if (context.sinkFailed)
    {
        result.error = ErrorKind::Io;
        result.message = "Failed to write downloaded data";
        return result;
    }

    if (res != CURLE_OK)
    {
        ErrorType errorType = classifyError(res, httpCode);
        result.error = ErrorKind::Network;
        result.retryable = errorType != ErrorType::Permanent;
        result.message = curl_easy_strerror(res);
        return result;
    }

    // Any final HTTP status outside 2xx, including 304 and redirects without a Location
    if (failedHttpStatus(curl.get()) != 0)
    {
        ErrorType errorType = classifyError(res, httpCode);
        result.error = ErrorKind::HttpStatus;
        result.retryable = errorType == ErrorType::Transient;
        result.message = fmt::format("HTTP error {}: {}", httpCode, getHttpStatusText(httpCode));
        return result;
    }

    // Empty body: the write callback never ran
    if (!startBody(context))
    {
        result.error = ErrorKind::Io;
        result.message = "Failed to create output file";
        return result;
    }
    result.contentLength = context.contentLength;

    return result;
}

bool HttpClient::isSuccessStatus(long code)
{
    return code >= 200 && code < 300;
}

long HttpClient::failedHttpStatus(CURL *handle)
{
    long httpCode = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &httpCode);
    if (httpCode == 0)
    {
        return 0;
    }

    // FTP and other protocols report their own reply codes here
    char *scheme = nullptr;
    curl_easy_getinfo(handle, CURLINFO_SCHEME, &scheme);
    bool http = scheme && (strcasecmp(scheme, "http") == 0 || strcasecmp(scheme, "https") == 0);

    return (http && !isSuccessStatus(httpCode)) ? httpCode : 0;
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::getHttpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 408:
        return "Request Timeout";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown Status";
    }
}

// Classify error for retry logic
HttpClient::ErrorType HttpClient::classifyError(CURLcode code, long httpCode)
{
    // First, check CURL-level errors (network, DNS, etc.)
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:           // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:          // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL:   // Protocol not supported
    case CURLE_FILE_COULDNT_READ_FILE: // file:// target missing
    case CURLE_OUT_OF_MEMORY:          // System resource exhaustion
    case CURLE_SSL_CERTPROBLEM:        // SSL certificate invalid
    case CURLE_SSL_CIPHER:             // SSL cipher negotiation failed
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_TOO_MANY_REDIRECTS:
        return ErrorType::Permanent;

    // No CURL error - check HTTP status code
    case CURLE_OK:
        if (httpCode >= 400 && httpCode < 500)
        {
            // 4xx Client Errors - the identical request fails again
            return ErrorType::Permanent;
        }
        else if (httpCode >= 500 && httpCode < 600)
        {
            // 5xx Server Errors - usually transient (server overload, temporary issues)
            return ErrorType::Transient;
        }
        return ErrorType::Unknown;

    // Unknown CURL error - be conservative and retry
    default:
        return ErrorType::Unknown;
    }
}
