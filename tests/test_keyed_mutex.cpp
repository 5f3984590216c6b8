//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_keyed_mutex.cpp
// Purpose: GoogleTests for per-key exclusion, FIFO handoff, release-on-throw and Clear semantics
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "mcplink/sync/KeyedMutex.h"

using namespace mcplink::sync;

namespace {
// Spin until the queue for key reaches n waiters (bounded).
bool waitForQueue(const KeyedMutex& m, const std::string& key, std::size_t n) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (m.GetQueueLength(key) >= n) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}
} // namespace

TEST(KeyedMutex, ConcurrentCounterHasNoLostUpdates) {
    KeyedMutex m;
    int counter = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&] {
            m.RunExclusive("counter", [&] {
                int read = counter;
                std::this_thread::yield();
                counter = read + 1;
            });
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(counter, 100);
    EXPECT_FALSE(m.IsLocked("counter"));
    EXPECT_EQ(m.GetQueueLength("counter"), 0u);
}

TEST(KeyedMutex, KeysAreIndependent) {
    KeyedMutex m;
    auto a = m.Acquire("a");
    auto fut = std::async(std::launch::async, [&] {
        auto b = m.Acquire("b");
        return m.IsLocked("b");
    });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(fut.get());
    EXPECT_TRUE(m.IsLocked("a"));
    EXPECT_FALSE(m.IsLocked("b"));
}

TEST(KeyedMutex, ReleasesOnThrow) {
    KeyedMutex m;
    EXPECT_THROW(m.RunExclusive("k", []() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_FALSE(m.IsLocked("k"));
    int v = m.RunExclusive("k", [] { return 7; });
    EXPECT_EQ(v, 7);
}

TEST(KeyedMutex, SafeModeReturnsResult) {
    KeyedMutex m;
    auto ok = m.RunExclusiveSafe("k", [] { return std::string("done"); });
    EXPECT_TRUE(ok.success);
    ASSERT_TRUE(ok.value.has_value());
    EXPECT_EQ(*ok.value, "done");

    auto bad = m.RunExclusiveSafe("k", []() -> int { throw std::runtime_error("nope"); });
    EXPECT_FALSE(bad.success);
    EXPECT_FALSE(bad.value.has_value());
    EXPECT_EQ(bad.error, "nope");

    auto unknown = m.RunExclusiveSafe("k", [] { throw 42; });
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.error, "Unknown error");
    EXPECT_FALSE(m.IsLocked("k"));
}

TEST(KeyedMutex, ReleaseIsIdempotent) {
    KeyedMutex m;
    auto h = m.Acquire("k");
    EXPECT_TRUE(m.IsLocked("k"));
    h.Release();
    EXPECT_TRUE(h.IsReleased());
    EXPECT_FALSE(m.IsLocked("k"));
    auto h2 = m.Acquire("k");
    h.Release();
    EXPECT_TRUE(m.IsLocked("k"));
}

TEST(KeyedMutex, WaitersAreServedInArrivalOrder) {
    KeyedMutex m;
    auto holder = m.Acquire("fifo");
    std::mutex orderMtx;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([&, i] {
            m.RunExclusive("fifo", [&] {
                std::lock_guard<std::mutex> lk(orderMtx);
                order.push_back(i);
            });
        });
        ASSERT_TRUE(waitForQueue(m, "fifo", static_cast<std::size_t>(i + 1)));
    }
    EXPECT_EQ(m.GetQueueLength("fifo"), 5u);
    holder.Release();
    for (auto& t : threads) t.join();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(KeyedMutex, HolderAndDiagnostics) {
    KeyedMutex m;
    EXPECT_FALSE(m.GetLockHolder("x").has_value());
    EXPECT_FALSE(m.GetLockDuration("x").has_value());
    auto h = m.Acquire("x", "worker-1");
    auto holder = m.GetLockHolder("x");
    ASSERT_TRUE(holder.has_value());
    EXPECT_EQ(*holder, "worker-1");
    EXPECT_TRUE(m.GetLockDuration("x").has_value());

    auto diags = m.GetDiagnostics();
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].key, "x");
    EXPECT_TRUE(diags[0].locked);
    EXPECT_EQ(diags[0].queueLength, 0u);
    EXPECT_EQ(m.GetKeys(), (std::vector<std::string>{"x"}));
}

TEST(KeyedMutex, ClearWakesQueuedWaiter) {
    KeyedMutex m;
    auto holder = m.Acquire("k");
    std::atomic<bool> entered{false};
    auto fut = std::async(std::launch::async, [&] {
        auto h = m.Acquire("k");
        entered = true;
    });
    ASSERT_TRUE(waitForQueue(m, "k", 1));
    m.Clear("k");
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    fut.get();
    EXPECT_TRUE(entered.load());
    EXPECT_TRUE(m.GetKeys().empty());

    // The stale handle must not release a lock taken on the fresh entry.
    auto fresh = m.Acquire("k");
    holder.Release();
    EXPECT_TRUE(m.IsLocked("k"));
}

TEST(KeyedMutex, ClearAllDropsEveryEntry) {
    KeyedMutex m;
    m.RunExclusive("a", [] {});
    m.RunExclusive("b", [] {});
    EXPECT_EQ(m.GetKeys().size(), 2u);
    m.ClearAll();
    EXPECT_TRUE(m.GetKeys().empty());
    EXPECT_FALSE(m.IsLocked("a"));
}
