/**
 * Bounded retry with backoff
 *
 * Decoupled from any particular storage call: the operation is a callable that
 * either returns normally (success) or throws (failed attempt). The loop never
 * runs more than `max_attempts` times and honours a cancellation token with an
 * optional deadline, both before each attempt and while waiting.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "fedrelay/error.hpp"

namespace fedrelay {

using Millis = std::chrono::milliseconds;

/**
 * Caller-supplied cancellation signal. Cancel explicitly, or give it a
 * deadline; either way waiting retries wake up early.
 */
class CancellationToken {
public:
    using SteadyClock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(SteadyClock::time_point deadline) : deadline_(deadline) {}

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        if (cancelled_.load()) return true;
        return deadline_ && SteadyClock::now() >= *deadline_;
    }

    const std::optional<SteadyClock::time_point>& deadline() const { return deadline_; }

    // Sleeps up to `duration`. Returns false if cancelled or past the deadline.
    bool wait_for(Millis duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        auto until = SteadyClock::now() + duration;
        if (deadline_ && *deadline_ < until) {
            until = *deadline_;
        }
        cv_.wait_until(lock, until, [this] { return cancelled_.load(); });
        return !is_cancelled();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<SteadyClock::time_point> deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

struct RetryPolicy {
    int max_attempts = 3;
    // Delay before attempt `attempt + 1`, given the 1-based failed attempt.
    std::function<Millis(int attempt)> delay = [](int attempt) { return Millis(1000 * attempt); };

    static RetryPolicy linear_backoff(int max_attempts, Millis base) {
        RetryPolicy p;
        p.max_attempts = max_attempts;
        p.delay = [base](int attempt) { return base * attempt; };
        return p;
    }
};

// Performs the wait between attempts. Returns false if the wait was cut short
// by cancellation. Tests substitute a recorder that does not sleep.
using Sleeper = std::function<bool(Millis, const CancellationToken*)>;

inline bool default_sleeper(Millis duration, const CancellationToken* cancel) {
    if (cancel) {
        return cancel->wait_for(duration);
    }
    std::this_thread::sleep_for(duration);
    return true;
}

/**
 * Run `op` until it succeeds or the policy is exhausted.
 *
 * @param on_failure called with (attempt, error text) after each failed attempt
 * @return the 1-based attempt number that succeeded
 * @throws RetryExhaustedError after `max_attempts` failures
 * @throws CancelledError if cancelled before an attempt or during a wait
 */
template <typename Op>
int retry_with_backoff(const RetryPolicy& policy, Op&& op,
                       const CancellationToken* cancel = nullptr,
                       const Sleeper& sleeper = default_sleeper,
                       const std::function<void(int, const std::string&)>& on_failure = {}) {
    FEDRELAY_CHECK_ARGUMENT(policy.max_attempts >= 1,
                            "max_attempts must be >= 1, got " + std::to_string(policy.max_attempts));

    std::string last_error;
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (cancel && cancel->is_cancelled()) {
            throw CancelledError("Cancelled before attempt " + std::to_string(attempt), last_error);
        }

        try {
            op(attempt);
            return attempt;
        } catch (const CancelledError&) {
            throw;
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        if (on_failure) {
            on_failure(attempt, last_error);
        }

        if (attempt < policy.max_attempts) {
            Millis wait = policy.delay ? policy.delay(attempt) : Millis(0);
            if (!sleeper(wait, cancel)) {
                throw CancelledError("Cancelled while waiting to retry after attempt " +
                                     std::to_string(attempt), last_error);
            }
        }
    }

    throw RetryExhaustedError(policy.max_attempts, last_error);
}

} // namespace fedrelay
