#include "downloader.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "loopback_server.hpp"
#include "test_support.hpp"

#include <optional>
#include <thread>

using namespace std::chrono_literals;

namespace
{
    const std::string ABC_SHA256 = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

    /**
     * Keeps the body in memory and records what the transport handed over.
     */
    class MemorySink : public TransferSink
    {
    public:
        bool begin(std::optional<std::uint64_t> contentLength) override
        {
            begun = true;
            length = contentLength;
            return acceptBegin;
        }

        bool write(const char *data, std::size_t size) override
        {
            body.append(data, size);
            return true;
        }

        bool acceptBegin = true;
        bool begun = false;
        std::optional<std::uint64_t> length;
        std::string body;
    };

    TransferRequest requestFor(const std::string &url)
    {
        TransferRequest request;
        request.url = url;
        request.connectTimeout = 5s;
        request.timeout = 20s;
        request.proxyMode = ProxyMode::None;
        request.userAgent = "mirrorfetch-test";
        return request;
    }

    std::string fileUrl(const std::filesystem::path &path)
    {
        return "file://" + path.string();
    }

    FetchConfig localConfig(const TempDir &dir)
    {
        BackoffPolicy backoff;
        backoff.initialDelay = 1ms;
        backoff.maxDelay = 5ms;
        backoff.jitter = false;
        return FetchConfig::builder()
            .destinationDir(dir.path())
            .proxyMode(ProxyMode::None)
            .connectTimeout(5s)
            .timeout(20s)
            .backoff(backoff)
            .build();
    }
}

int main()
{
    TestRun run("http_client");
    Log::setLevel(LogLevel::Off);

    try
    {
        HttpClient client;
        CancellationToken idle;
        TempDir source("http-source");
        writeFile(source.path() / "abc.txt", "abc");
        writeFile(source.path() / "empty.bin", "");
        std::string large(100000, 'q');
        writeFile(source.path() / "large.bin", large);

        run.section("Status classes");
        run.expect(HttpClient::isSuccessStatus(200) && HttpClient::isSuccessStatus(206), "2xx is success");
        run.expect(!HttpClient::isSuccessStatus(304) && !HttpClient::isSuccessStatus(302) &&
                       !HttpClient::isSuccessStatus(101) && !HttpClient::isSuccessStatus(404),
                   "1xx, 3xx and 4xx are not");
        run.expect(HttpClient::getHttpStatusText(304) == "Not Modified", "Status text for 304");

        run.section("file:// transfers");
        {
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(fileUrl(source.path() / "large.bin")), sink, idle);
            run.expect(result.ok() && sink.begun, "Existing file is fetched");
            run.expect(sink.body == large && result.bytesReceived == large.size(), "Body bytes arrive unchanged");
            run.expect(result.contentLength == std::optional<std::uint64_t>(large.size()),
                       "File size is reported as content length");
        }
        {
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(fileUrl(source.path() / "empty.bin")), sink, idle);
            run.expect(result.ok() && sink.begun && sink.body.empty(),
                       "Empty body still opens the sink");
        }
        {
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(fileUrl(source.path() / "missing.bin")), sink, idle);
            run.expect(result.error == ErrorKind::Network && !result.retryable,
                       "Missing file is a non-retryable network error");
            run.expect(!sink.begun, "Nothing reaches the sink for a missing file");
        }
        {
            MemorySink sink;
            sink.acceptBegin = false;
            TransferResult result = client.fetch(requestFor(fileUrl(source.path() / "abc.txt")), sink, idle);
            run.expect(result.error == ErrorKind::Io, "Sink refusing the body is an I/O error");

            MemorySink emptySink;
            emptySink.acceptBegin = false;
            result = client.fetch(requestFor(fileUrl(source.path() / "empty.bin")), emptySink, idle);
            run.expect(result.error == ErrorKind::Io, "Sink refusing an empty body is an I/O error");
        }
        {
            CancellationToken cancelled;
            cancelled.cancel();
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(fileUrl(source.path() / "abc.txt")), sink, cancelled);
            run.expect(result.error == ErrorKind::Cancelled && !sink.begun, "Cancelled token stops before the request");
        }

        run.section("Downloader over libcurl");
        {
            TempDir dir("http-dest");
            Downloader downloader(localConfig(dir));
            Download download(fileUrl(source.path() / "abc.txt"));
            download.expectedDigest(ABC_SHA256);

            DownloadSummary summary = downloader.run({download}).front();
            run.expect(summary.ok() && summary.verified, "Local file is downloaded and verified");
            run.expect(readFile(dir.path() / "abc.txt") == "abc" && summary.bytesWritten == 3,
                       "Destination holds the source bytes");
        }
        {
            TempDir dir("http-blocked");
            writeFile(dir.path() / "blocker", "regular file");
            Downloader downloader(localConfig(dir));
            Download download("blocked", {fileUrl(source.path() / "abc.txt"), fileUrl(source.path() / "large.bin")});
            download.destinationName("blocker/abc.txt");

            DownloadSummary summary = downloader.run({download}).front();
            run.expect(!summary.ok() && summary.failure && summary.failure->kind == ErrorKind::Io,
                       "Unwritable destination fails with an I/O error");
            run.expect(summary.attempts.size() == 1, "No other mirror is tried");
        }

        run.section("HTTP status handling");
        {
            LoopbackServer server("HTTP/1.1 304 Not Modified\r\nConnection: close\r\n\r\n");
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(server.url("/redir/r.bin")), sink, idle);
            run.expect(result.error == ErrorKind::HttpStatus && result.httpStatus == 304 && !result.retryable,
                       "304 is a non-retryable status error");
            run.expect(!sink.begun, "304 never opens the sink");
        }
        {
            LoopbackServer server("HTTP/1.1 304 Not Modified\r\nConnection: close\r\n\r\n");
            TempDir dir("http-304");
            Downloader downloader(localConfig(dir));
            DownloadSummary summary = downloader.run({Download(server.url("/redir/r.bin"))}).front();
            run.expect(!summary.ok() && !summary.finalMirror, "304 does not count as a successful download");
            run.expect(summary.failure && !summary.failure->mirrorErrors.empty() &&
                           summary.failure->mirrorErrors.front().httpStatus == 304,
                       "Mirror error keeps the 304 status");
            run.expect(!std::filesystem::exists(dir.path() / "r.bin"), "No empty file is created");
            run.expect(server.requests() == 1, "304 is not retried");
        }
        {
            LoopbackServer server("HTTP/1.1 302 Found\r\nContent-Length: 5\r\nConnection: close\r\n\r\nmoved");
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(server.url("/moved.bin")), sink, idle);
            run.expect(result.error == ErrorKind::HttpStatus && result.httpStatus == 302 && !result.retryable,
                       "Redirect without Location is a status error");
            run.expect(sink.body.empty() && !sink.begun, "Redirect body is discarded");
        }
        {
            LoopbackServer server("HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\nConnection: close\r\n\r\nnot found");
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(server.url("/gone.bin")), sink, idle);
            run.expect(result.error == ErrorKind::HttpStatus && result.httpStatus == 404 && !result.retryable,
                       "404 is a non-retryable status error");
            run.expect(sink.body.empty() && !sink.begun, "Error page is discarded");
        }
        {
            LoopbackServer server("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 4\r\nConnection: close\r\n\r\nbusy");
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(server.url("/busy.bin")), sink, idle);
            run.expect(result.error == ErrorKind::HttpStatus && result.httpStatus == 503 && result.retryable,
                       "503 is retryable");
        }
        {
            LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 3\r\nConnection: close\r\n\r\nabc");
            MemorySink sink;
            TransferResult result = client.fetch(requestFor(server.url("/abc.txt")), sink, idle);
            run.expect(result.ok() && result.httpStatus == 200 && sink.body == "abc", "200 delivers the body");
            run.expect(sink.length == std::optional<std::uint64_t>(3), "Content-Length reaches the sink");
        }

        run.section("Cancellation during a transfer");
        {
            LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 100000\r\n\r\npartial", true);
            CancellationToken token;
            MemorySink sink;

            auto start = std::chrono::steady_clock::now();
            std::thread canceller([&token]
                                  {
                                      std::this_thread::sleep_for(200ms);
                                      token.cancel(); });
            TransferResult result = client.fetch(requestFor(server.url("/stalled.bin")), sink, token);
            canceller.join();
            auto elapsed = std::chrono::steady_clock::now() - start;

            run.expect(result.error == ErrorKind::Cancelled, "Stalled transfer ends as cancelled");
            run.expect(elapsed < 5s, "Cancellation is observed promptly");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
