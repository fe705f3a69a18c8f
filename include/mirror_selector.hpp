#pragma once

#include <chrono>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

/**
 * What to do after a failed attempt.
 */
enum class RetryDecision
{
    RetrySameMirror, // back off, then try the same mirror again
    NextMirror,      // move on without consuming same-mirror retries
    Exhausted,       // no mirror left
    Abort            // local or global failure, stop this Download
};

/**
 * Same-mirror retry allowance and backoff delays.
 */
class RetryPolicy
{
public:
    RetryPolicy(int retryCount, BackoffPolicy backoff);

    int attemptsPerMirror() const { return retryCount_ + 1; }

    /**
     * Whether a failure of this kind may be retried against the same mirror.
     * Io, Cancelled and Timeout end the Download; Verification moves on,
     * since the same mirror serves the same bytes.
     */
    static bool isFatal(ErrorKind kind);

    /**
     * Delay before same-mirror retry number `retry` (1-based), jittered by
     * up to +/-20% when the backoff policy asks for it.
     */
    std::chrono::milliseconds delayBefore(int retry, std::mt19937 &rng) const;

private:
    int retryCount_;
    BackoffPolicy backoff_;
};

/**
 * Per-Download mirror failover state machine.
 *
 * The mirror order is fixed when the selector is created: shuffled once
 * with the worker's own random engine (or kept in insertion order).
 * Each mirror gets up to RetryPolicy::attemptsPerMirror() attempts.
 */
class MirrorSelector
{
public:
    MirrorSelector(const std::vector<std::string> &mirrors, const RetryPolicy &policy,
                   std::mt19937 &rng, bool shuffle);

    bool exhausted() const { return mirrorIndex_ >= order_.size(); }

    /**
     * Mirror of the next attempt. Must not be called once exhausted().
     */
    const std::string &currentMirror() const { return order_[mirrorIndex_]; }

    /**
     * 1-based attempt number on the current mirror.
     */
    int attempt() const { return attempt_; }

    const std::vector<std::string> &order() const { return order_; }

    /**
     * Advance the state after a failed attempt on currentMirror().
     *
     * @param kind Error class of the failed attempt
     * @param retryable Transport's verdict for Network/HttpStatus errors
     */
    RetryDecision onFailure(ErrorKind kind, bool retryable);

private:
    RetryDecision advance();

    const RetryPolicy &policy_;
    std::vector<std::string> order_;
    std::size_t mirrorIndex_ = 0;
    int attempt_ = 1;
};
