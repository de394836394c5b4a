// =============================================================================
// KeyedMutex Tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "fedrelay/error.hpp"
#include "fedrelay/key_lock.hpp"

using namespace fedrelay;

TEST(KeyedMutexTest, SameKeyIsExclusive) {
    KeyedMutex locks;
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    auto worker = [&] {
        for (int i = 0; i < 50; ++i) {
            KeyedMutex::Guard guard(locks, "model/globalModel.bin");
            int now = ++inside;
            int prev = max_inside.load();
            while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
            std::this_thread::yield();
            --inside;
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(locks.active_keys(), 0u);
}

TEST(KeyedMutexTest, DifferentKeysDoNotBlock) {
    KeyedMutex locks;
    KeyedMutex::Guard a(locks, "a/globalModel.bin");

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        KeyedMutex::Guard b(locks, "b/globalModel.bin");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.active_keys(), 1u);
}

TEST(KeyedMutexTest, WaiterProceedsAfterRelease) {
    KeyedMutex locks;
    std::atomic<bool> acquired{false};

    locks.lock("k");
    std::thread waiter([&] {
        KeyedMutex::Guard g(locks, "k");
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(acquired.load());
    locks.unlock("k");
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST(KeyedMutexTest, WaitGivesUpAtTokenDeadline) {
    KeyedMutex locks;
    locks.lock("k");

    CancellationToken token(CancellationToken::SteadyClock::now() + std::chrono::milliseconds(50));
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(KeyedMutex::Guard g(locks, "k", &token), CancelledError);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_GE(waited, std::chrono::milliseconds(40));
    EXPECT_LT(waited, std::chrono::milliseconds(1000));
    // The abandoned wait must not leave a reference behind.
    EXPECT_EQ(locks.active_keys(), 1u);
    locks.unlock("k");
    EXPECT_EQ(locks.active_keys(), 0u);
}

TEST(KeyedMutexTest, ExplicitCancelWakesWaiter) {
    KeyedMutex locks;
    locks.lock("k");

    CancellationToken token;
    std::atomic<bool> cancelled{false};
    std::thread waiter([&] {
        try {
            KeyedMutex::Guard g(locks, "k", &token);
        } catch (const CancelledError&) {
            cancelled = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    token.cancel();
    waiter.join();

    EXPECT_TRUE(cancelled.load());
    locks.unlock("k");
    EXPECT_EQ(locks.active_keys(), 0u);
}

TEST(KeyedMutexTest, UnexpiredTokenStillAcquires) {
    KeyedMutex locks;
    CancellationToken token(CancellationToken::SteadyClock::now() + std::chrono::seconds(10));
    std::atomic<bool> acquired{false};

    locks.lock("k");
    std::thread waiter([&] {
        KeyedMutex::Guard g(locks, "k", &token);
        acquired = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    locks.unlock("k");
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.active_keys(), 0u);
}
