#include "progress.hpp"
#include "log.hpp"

#include <exception>
#include <utility>

void ProgressReporter::setCallback(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void ProgressReporter::setDoneCallback(DoneCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    doneCallback_ = std::move(callback);
}

template <typename Invoke>
void ProgressReporter::guarded(const std::string &id, Invoke &&invoke)
{
    // Caller holds mutex_
    try
    {
        invoke();
    }
    catch (const std::exception &e)
    {
        ++faults_;
        Log::warn("Progress callback for '{}' failed: {}", id, e.what());
    }
    catch (...)
    {
        ++faults_;
        Log::warn("Progress callback for '{}' threw a non-standard exception", id);
    }
}

void ProgressReporter::report(const std::string &id, std::uint64_t bytesDone,
                              std::optional<std::uint64_t> bytesTotal)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!callback_)
    {
        return;
    }
    guarded(id, [&]
            { callback_(id, bytesDone, bytesTotal); });
}

void ProgressReporter::done(const std::string &id, bool success)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!doneCallback_)
    {
        return;
    }
    guarded(id, [&]
            { doneCallback_(id, success); });
}

std::uint64_t ProgressReporter::callbackFaults() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return faults_;
}

ProgressThrottle::ProgressThrottle(ProgressReporter &reporter, std::string id,
                                   std::chrono::milliseconds interval)
    : reporter_(reporter), id_(std::move(id)), interval_(interval)
{
}

void ProgressThrottle::update(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal)
{
    auto now = std::chrono::steady_clock::now();
    if (lastForwarded_ && now - *lastForwarded_ < interval_)
    {
        return;
    }
    forward(bytesDone, bytesTotal);
}

void ProgressThrottle::flush(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal)
{
    if (lastForwarded_ && lastBytes_ == bytesDone)
    {
        return;
    }
    forward(bytesDone, bytesTotal);
}

void ProgressThrottle::restart()
{
    lastForwarded_.reset();
    lastBytes_ = 0;
}

void ProgressThrottle::forward(std::uint64_t bytesDone, std::optional<std::uint64_t> bytesTotal)
{
    lastForwarded_ = std::chrono::steady_clock::now();
    lastBytes_ = bytesDone;
    reporter_.report(id_, bytesDone, bytesTotal);
}
