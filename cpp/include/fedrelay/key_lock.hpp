#pragma once

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>

#include "fedrelay/retry.hpp"

namespace fedrelay {

/**
 * One mutex per string key, created on demand and released when the last
 * holder or waiter leaves. Serializes read-merge-write on a single model key
 * while letting different keys proceed in parallel.
 *
 * Usage:
 *   KeyedMutex::Guard guard(locks, "model-a/globalModel.bin", &token);
 *   ... fetch, merge, write ...
 *
 * With a token, waiting for the key gives up with CancelledError once the
 * token is cancelled or its deadline passes.
 */
class KeyedMutex {
public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, const std::string& key, const CancellationToken* cancel = nullptr)
            : owner_(owner), key_(key) {
            owner_.lock(key_, cancel);
        }
        ~Guard() { owner_.unlock(key_); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
    };

    void lock(const std::string& key, const CancellationToken* cancel = nullptr) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto& entry = entries_[key];
        ++entry.refs;
        if (!cancel) {
            cv_.wait(lock, [&entry] { return !entry.held; });
            entry.held = true;
            return;
        }

        // cancel() signals the token's own condition variable, so poll in
        // short slices as well as waking at the deadline.
        while (entry.held) {
            if (cancel->is_cancelled()) {
                if (--entry.refs == 0) {
                    entries_.erase(key);
                }
                throw CancelledError("Gave up waiting for the lock on " + key, "KeyedMutex");
            }
            auto until = CancellationToken::SteadyClock::now() + kCancelPoll;
            if (cancel->deadline()) {
                until = std::min(until, *cancel->deadline());
            }
            cv_.wait_until(lock, until);
        }
        entry.held = true;
    }

    void unlock(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) return;
            it->second.held = false;
            if (--it->second.refs == 0) {
                entries_.erase(it);
            }
        }
        cv_.notify_all();
    }

    // Number of keys currently locked or awaited.
    size_t active_keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    static constexpr Millis kCancelPoll{20};

    struct Entry {
        bool held = false;
        size_t refs = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace fedrelay
