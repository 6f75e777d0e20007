#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "../common/ack_signal.hpp"

using namespace std::chrono_literals;

TEST(AckSignalTest, TimesOutWithoutRaise)
{
    ack_signal signal;
    uint64_t seen = signal.generation();

    auto start = steady_clock::now();
    EXPECT_FALSE(signal.wait_for(seen, 30ms));
    EXPECT_GE(steady_clock::now() - start, 30ms);
    EXPECT_EQ(seen, 0u);
}

TEST(AckSignalTest, RaiseBeforeWaitIsNotLost)
{
    ack_signal signal;
    uint64_t seen = signal.generation();

    signal.raise();
    EXPECT_TRUE(signal.wait_for(seen, 1000ms));
    EXPECT_EQ(seen, 1u);

    // already consumed, so the next wait times out
    EXPECT_FALSE(signal.wait_for(seen, 10ms));
}

TEST(AckSignalTest, SupportsRepeatedCycles)
{
    ack_signal signal;
    uint64_t seen = signal.generation();

    for (int i = 0; i < 5; ++i)
    {
        std::thread raiser([&]
                           {
            std::this_thread::sleep_for(5ms);
            signal.raise(); });
        EXPECT_TRUE(signal.wait_for(seen, 2000ms));
        raiser.join();
    }
    EXPECT_EQ(seen, 5u);
}

TEST(AckSignalTest, SeveralRaisesWakeOnce)
{
    ack_signal signal;
    uint64_t seen = signal.generation();

    signal.raise();
    signal.raise();
    signal.raise();

    EXPECT_TRUE(signal.wait_for(seen, 100ms));
    EXPECT_EQ(seen, 3u);
    EXPECT_FALSE(signal.wait_for(seen, 10ms));
}

TEST(AckSignalTest, HugeTimeoutSaturatesInsteadOfWrapping)
{
    EXPECT_EQ(deadline_after(duration_ms::max()), timepoint::max());
    EXPECT_GT(deadline_after(std::chrono::hours(24 * 365 * 1000)), steady_clock::now());

    auto before = steady_clock::now();
    timepoint d = deadline_after(1000ms);
    EXPECT_GE(d, before + 1000ms);

    ack_signal signal;
    uint64_t seen = signal.generation();
    signal.raise();
    EXPECT_TRUE(signal.wait_for(seen, duration_ms::max()));
    EXPECT_EQ(seen, 1u);
}
