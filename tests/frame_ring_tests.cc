#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "render/frame_ring.h"

namespace {

using bimview::render::FrameRing;
using bimview::render::FrameTicket;

} // namespace

TEST(FrameRingTest, ReadSlotTrailsWriteSlotByFramesInFlight) {
    FrameRing<int> ring(4, 0);
    EXPECT_EQ(ring.maxInFlight(), 3u);
    EXPECT_EQ(ring.readData(), nullptr);

    std::vector<FrameTicket> tickets;
    for (int i = 0; i < 3; ++i) {
        const std::optional<FrameTicket> ticket = ring.beginFrame();
        ASSERT_TRUE(ticket.has_value());
        ring.writeData() = 10 + i;
        tickets.push_back(*ticket);
    }
    EXPECT_EQ(ring.writeIndex(), 2u);
    EXPECT_EQ(ring.inFlightCount(), 3u);
    EXPECT_FALSE(ring.beginFrame().has_value());

    ASSERT_TRUE(ring.complete(tickets[0]));
    ASSERT_NE(ring.readData(), nullptr);
    EXPECT_EQ(ring.readIndex(), 0u);
    EXPECT_EQ(*ring.readData(), 10);

    ASSERT_TRUE(ring.complete(tickets[1]));
    EXPECT_EQ(ring.readIndex(), 1u);
    EXPECT_EQ(*ring.readData(), 11);
    EXPECT_EQ(ring.inFlightCount(), 1u);
}

TEST(FrameRingTest, ReadNeverOvertakesWriteAcrossWrapAround) {
    FrameRing<int> ring(3, -1);
    std::optional<FrameTicket> pending;
    for (int frame = 0; frame < 20; ++frame) {
        const std::optional<FrameTicket> ticket = ring.beginFrame();
        ASSERT_TRUE(ticket.has_value());
        ring.writeData() = frame;
        if (pending.has_value()) {
            ASSERT_TRUE(ring.complete(*pending));
            // The read slot holds the previous frame, never the one being written.
            EXPECT_NE(ring.readIndex(), ring.writeIndex());
            EXPECT_EQ(*ring.readData(), frame - 1);
        }
        pending = ticket;
    }
}

TEST(FrameRingTest, CompletionsMustArriveInOrder) {
    FrameRing<int> ring(3, 0);
    const std::optional<FrameTicket> first = ring.beginFrame();
    const std::optional<FrameTicket> second = ring.beginFrame();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_FALSE(ring.complete(*second));
    EXPECT_FALSE(ring.hasCompletedData());
    EXPECT_TRUE(ring.complete(*first));
    EXPECT_TRUE(ring.complete(*second));
    EXPECT_FALSE(ring.complete(*second));
}

TEST(FrameRingTest, ResetInvalidatesOutstandingTickets) {
    FrameRing<int> ring(3, 0);
    const std::optional<FrameTicket> stale = ring.beginFrame();
    ASSERT_TRUE(stale.has_value());

    ring.reset(5, 7);
    EXPECT_EQ(ring.slotCount(), 5u);
    EXPECT_EQ(ring.inFlightCount(), 0u);
    EXPECT_EQ(ring.slot(4), 7);
    EXPECT_NE(ring.epoch(), stale->epoch);
    EXPECT_FALSE(ring.complete(*stale));
    EXPECT_EQ(ring.readData(), nullptr);

    const std::optional<FrameTicket> fresh = ring.beginFrame();
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->slot, 0u);
    EXPECT_EQ(fresh->frameNumber, 1u);
}

TEST(FrameRingTest, SlotCountBelowTwoIsRaised) {
    FrameRing<int> ring(1, 0);
    EXPECT_EQ(ring.slotCount(), 2u);
    EXPECT_EQ(ring.maxInFlight(), 1u);
}
