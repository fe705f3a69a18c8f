#include "summary.hpp"
#include "format.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

std::string DownloadSummary::describe() const
{
    if (ok())
    {
        return fmt::format("ok ({} from {}){}", formatBytes(bytesWritten),
                           finalMirror.value_or("?"), verified ? ", verified" : "");
    }
    if (!failure)
    {
        return "failed";
    }

    std::string text = fmt::format("{}: {}", errorKindName(failure->kind), failure->message);
    for (const auto &mirror : failure->mirrorErrors)
    {
        text += fmt::format("\n    {} -> {}", mirror.url, mirror.message);
    }
    return text;
}

DownloadSummary DownloadSummary::failed(const std::string &id, ErrorKind kind, const std::string &message)
{
    DownloadSummary summary;
    summary.id = id;
    summary.status = Status::Failed;
    summary.failure = FailureReason{kind, message, {}};
    return summary;
}

SummaryAggregator::SummaryAggregator(std::size_t count) : slots_(count)
{
}

bool SummaryAggregator::record(std::size_t index, DownloadSummary summary)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= slots_.size() || slots_[index])
        {
            return false;
        }
        slots_[index] = std::move(summary);
        ++completed_;
    }
    condition_.notify_all();
    return true;
}

bool SummaryAggregator::has(std::size_t index) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index < slots_.size() && slots_[index].has_value();
}

std::size_t SummaryAggregator::completed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool SummaryAggregator::waitUntil(std::chrono::steady_clock::time_point deadline) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_until(lock, deadline, [this]
                                 { return completed_ == slots_.size(); });
}

void SummaryAggregator::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this]
                    { return completed_ == slots_.size(); });
}

std::vector<DownloadSummary> SummaryAggregator::take()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_ != slots_.size())
    {
        throw std::logic_error(fmt::format("Only {} of {} downloads have a summary",
                                           completed_, slots_.size()));
    }

    std::vector<DownloadSummary> result;
    result.reserve(slots_.size());
    for (auto &slot : slots_)
    {
        result.push_back(std::move(*slot));
    }
    slots_.clear();
    completed_ = 0;
    return result;
}
