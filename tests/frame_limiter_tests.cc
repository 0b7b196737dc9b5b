#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "render/frame_limiter.h"

TEST(FrameLimiterTest, TryAcquireStopsAtCapacity) {
    bimview::render::FrameLimiter limiter(2);
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_FALSE(limiter.tryAcquire());
    EXPECT_EQ(limiter.inFlight(), 2u);

    limiter.release();
    EXPECT_EQ(limiter.inFlight(), 1u);
    EXPECT_TRUE(limiter.tryAcquire());
}

TEST(FrameLimiterTest, AcquireForTimesOutWhenFull) {
    bimview::render::FrameLimiter limiter(1);
    limiter.acquire();
    EXPECT_FALSE(limiter.acquireFor(std::chrono::milliseconds{5}));
    limiter.release();
    EXPECT_TRUE(limiter.acquireFor(std::chrono::milliseconds{5}));
}

TEST(FrameLimiterTest, ReleaseFromAnotherThreadWakesAcquire) {
    bimview::render::FrameLimiter limiter(1);
    limiter.acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        limiter.acquire();
        acquired.store(true);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
    EXPECT_FALSE(acquired.load());
    limiter.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(limiter.inFlight(), 1u);
}

TEST(FrameLimiterTest, CapacityChangesOnlyWhenIdle) {
    bimview::render::FrameLimiter limiter(3);
    ASSERT_TRUE(limiter.tryAcquire());
    EXPECT_FALSE(limiter.setCapacity(1));
    EXPECT_EQ(limiter.capacity(), 3u);

    limiter.release();
    EXPECT_TRUE(limiter.setCapacity(1));
    EXPECT_EQ(limiter.capacity(), 1u);

    EXPECT_TRUE(limiter.setCapacity(0));
    EXPECT_EQ(limiter.capacity(), 1u);
}

TEST(FrameLimiterTest, ExtraReleaseIsIgnored) {
    bimview::render::FrameLimiter limiter(2);
    limiter.release();
    EXPECT_EQ(limiter.inFlight(), 0u);
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_TRUE(limiter.tryAcquire());
    EXPECT_FALSE(limiter.tryAcquire());
}
