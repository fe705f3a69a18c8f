#include "transport.hpp"

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    condition_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}
