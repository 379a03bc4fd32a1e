#include <gtest/gtest.h>
#include "valtime/core/cancellation_token.hpp"
#include "valtime/core/event_queue.hpp"
#include "valtime/core/wake_signal.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace valtime;
using namespace std::chrono_literals;

// ============================================================================
// WakeSignal tests
// ============================================================================

TEST(WakeSignalTest, SignalWakesWaiter) {
    WakeSignal signal;
    std::atomic<bool> woke{false};

    std::thread waiter([&]() {
        signal.wait();
        woke = true;
    });

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(woke);

    signal.signal();
    waiter.join();
    EXPECT_TRUE(woke);
}

TEST(WakeSignalTest, ShutdownReturnsFalse) {
    WakeSignal signal;
    std::atomic<bool> result{true};

    std::thread waiter([&]() { result = signal.wait(); });
    std::this_thread::sleep_for(20ms);

    signal.requestShutdown();
    waiter.join();
    EXPECT_FALSE(result);
    EXPECT_FALSE(signal.wait());
}

TEST(WakeSignalTest, PastDeadlineReturnsImmediately) {
    WakeSignal signal;
    signal.setDeadline(WakeSignal::Clock::now() - 1ms);
    EXPECT_TRUE(signal.hasDeadline());
    EXPECT_TRUE(signal.wait());

    signal.clearDeadline();
    EXPECT_FALSE(signal.hasDeadline());
}

TEST(WakeSignalTest, DeadlineWakesWaiter) {
    WakeSignal signal;
    auto start = WakeSignal::Clock::now();
    signal.setDeadline(start + 30ms);

    EXPECT_TRUE(signal.wait());
    EXPECT_GE(WakeSignal::Clock::now() - start, 30ms);
}

// ============================================================================
// EventQueue tests
// ============================================================================

TEST(EventQueueTest, FifoOrder) {
    EventQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);
    EXPECT_EQ(queue.size(), 3u);

    EXPECT_EQ(queue.tryPop(), 1);
    EXPECT_EQ(queue.drainAll(), (std::vector<int>{2, 3}));
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(EventQueueTest, PushSignalsAttachedWake) {
    WakeSignal wake;
    EventQueue<std::string> a;
    EventQueue<std::string> b;
    a.attach(&wake);
    b.attach(&wake);

    std::thread producer([&]() {
        std::this_thread::sleep_for(10ms);
        b.push("from b");
    });

    EXPECT_TRUE(wake.wait());
    producer.join();
    EXPECT_TRUE(a.empty());
    EXPECT_EQ(b.tryPop(), "from b");
}

TEST(EventQueueTest, AttachWithPendingItemsSignals) {
    WakeSignal wake;
    EventQueue<int> queue;
    queue.push(7);
    queue.attach(&wake);

    // Returns without blocking
    EXPECT_TRUE(wake.waitFor(1000ms));
    EXPECT_EQ(queue.tryPop(), 7);
}

TEST(EventQueueTest, DetachedQueueDoesNotSignal) {
    WakeSignal wake;
    EventQueue<int> queue;
    queue.attach(&wake);
    queue.detach();
    queue.push(1);

    auto start = WakeSignal::Clock::now();
    wake.waitFor(30ms);
    EXPECT_GE(WakeSignal::Clock::now() - start, 25ms);
}

TEST(EventQueueTest, ShutdownDropsPushesButDrainsRemainder) {
    EventQueue<int> queue;
    queue.push(1);
    queue.shutdown();
    queue.push(2);

    EXPECT_TRUE(queue.isShutdown());
    EXPECT_FALSE(queue.waitForWork());
    EXPECT_EQ(queue.drainAll(), std::vector<int>{1});
}

TEST(EventQueueTest, WaitForWorkWakesOnPush) {
    EventQueue<int> queue;
    std::thread producer([&]() {
        std::this_thread::sleep_for(10ms);
        queue.push(5);
    });

    EXPECT_TRUE(queue.waitForWork());
    producer.join();
    EXPECT_EQ(queue.tryPop(), 5);
}

// ============================================================================
// CancellationToken tests
// ============================================================================

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken token;
    CancellationToken copy = token;
    EXPECT_FALSE(copy.isCancelled());

    token.cancel();
    EXPECT_TRUE(copy.isCancelled());
}

TEST(CancellationTokenTest, SleepCompletesWhenNotCancelled) {
    CancellationToken token;
    EXPECT_TRUE(token.sleepFor(5ms));
}

TEST(CancellationTokenTest, CancelCutsSleepShort) {
    CancellationToken token;
    std::thread canceller([&]() {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleepFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();

    // Already cancelled: no sleep at all
    EXPECT_FALSE(token.sleepFor(std::chrono::seconds(10)));
}
