#include "mirror_selector.hpp"

#include <algorithm>

RetryPolicy::RetryPolicy(int retryCount, BackoffPolicy backoff)
    : retryCount_(std::max(0, retryCount)), backoff_(backoff)
{
}

bool RetryPolicy::isFatal(ErrorKind kind)
{
    return kind == ErrorKind::Io || kind == ErrorKind::Cancelled || kind == ErrorKind::Timeout;
}

std::chrono::milliseconds RetryPolicy::delayBefore(int retry, std::mt19937 &rng) const
{
    std::chrono::milliseconds base = backoff_.delayFor(retry);
    if (!backoff_.jitter || base.count() == 0)
    {
        return base;
    }

    // Add random jitter: +/-20% variation to avoid a thundering herd
    std::uniform_int_distribution<int> dis(-20, 20);
    int jitterPercent = dis(rng);
    return base + std::chrono::milliseconds(base.count() * jitterPercent / 100);
}

MirrorSelector::MirrorSelector(const std::vector<std::string> &mirrors, const RetryPolicy &policy,
                               std::mt19937 &rng, bool shuffle)
    : policy_(policy), order_(mirrors)
{
    if (shuffle)
    {
        std::shuffle(order_.begin(), order_.end(), rng);
    }
}

RetryDecision MirrorSelector::onFailure(ErrorKind kind, bool retryable)
{
    if (RetryPolicy::isFatal(kind))
    {
        return RetryDecision::Abort;
    }

    bool sameMirror = retryable && (kind == ErrorKind::Network || kind == ErrorKind::HttpStatus);
    if (sameMirror && attempt_ < policy_.attemptsPerMirror())
    {
        ++attempt_;
        return RetryDecision::RetrySameMirror;
    }
    return advance();
}

RetryDecision MirrorSelector::advance()
{
    ++mirrorIndex_;
    attempt_ = 1;
    return exhausted() ? RetryDecision::Exhausted : RetryDecision::NextMirror;
}
