/************************************************
 * VVPlay Project - Adaptive Volumetric Video Streaming
 * ---------------------------------------------
 * 
 * Copyright (c) 2025 VVPlay Contributors
 * All rights reserved.
 * 
 * This source code is part of the VVPlay project, an adaptive
 * streaming and playback engine for volumetric video.
 * 
 * License:
 * This software is licensed under the BSD-3-Clause License.
 * You may use, modify, and distribute this software under
 * the conditions stated in the LICENSE file provided in the
 * project root.
 * 
 * Warranty Disclaimer:
 * This software is provided "AS IS," without any warranties
 * or guarantees, either expressed or implied, including but
 * not limited to fitness for a particular purpose.
 * 
 * Contributions:
 * Contributions to this project are welcome. By submitting 
 * code, you agree to license your contributions under the 
 * same BSD-3-Clause terms.
 * 
 * See LICENSE file for full details.
 ************************************************/

#include <gtest/gtest.h>
#include <libvvplay/playback/entry.hpp>
#include <stdexcept>

using namespace libvvplay;
using namespace libvvplay::playback;
using namespace std::chrono_literals;

namespace
{

constexpr MediaDuration FRAME = 40ms;

auto frame(FrameSeq seq) -> decoder::DecodedFrame
{
  decoder::DecodedFrame f;
  f.seq      = seq;
  f.pts      = FRAME * static_cast<i64>(seq);
  f.duration = FRAME;
  return f;
}

} // namespace

class PlaybackSchedulerTest : public ::testing::Test
{
protected:
  PlaybackQueue        queue;
  abr::BufferOccupancy occupancy{abr::UnderflowPolicy::Throw};
  PlaybackMetrics      metrics;
  const TimePoint      t0 = TimePoint{} + 1h;

  void push(FrameSeq seq)
  {
    queue.push(frame(seq));
    occupancy.onFrameEnqueued(FRAME);
  }

  auto scheduler(FrameCount total) -> PlaybackScheduler
  {
    return PlaybackScheduler(queue, occupancy, metrics, total);
  }
};

TEST_F(PlaybackSchedulerTest, EmptyQueueBeforeStartIsNotAStall)
{
  auto sched = scheduler(10);

  EXPECT_EQ(sched.tick(t0).status, TickStatus::Wait);
  EXPECT_EQ(sched.tick(t0 + 5s).status, TickStatus::Wait);
  EXPECT_FALSE(sched.started());
  EXPECT_EQ(metrics.stalls.load(), 0u);
}

TEST_F(PlaybackSchedulerTest, PresentsFramesAtTheirTimestamps)
{
  auto sched = scheduler(10);
  push(0);
  push(1);

  auto first = sched.tick(t0);
  ASSERT_EQ(first.status, TickStatus::Frame);
  EXPECT_EQ(first.frame->seq, 0u);

  auto early = sched.tick(t0 + 10ms);
  EXPECT_EQ(early.status, TickStatus::Wait);
  ASSERT_TRUE(early.next_due);
  EXPECT_EQ(*early.next_due, t0 + 40ms);

  auto second = sched.tick(t0 + 40ms);
  ASSERT_EQ(second.status, TickStatus::Frame);
  EXPECT_EQ(second.frame->seq, 1u);

  EXPECT_EQ(occupancy.occupancy(), MediaDuration::zero());
  EXPECT_EQ(metrics.frames_presented.load(), 2u);
}

TEST_F(PlaybackSchedulerTest, StallFreezesPositionAndResumeReanchors)
{
  auto sched = scheduler(10);
  push(0);
  ASSERT_EQ(sched.tick(t0).status, TickStatus::Frame);

  // Frame 1 is not due before t0 + 40ms
  EXPECT_EQ(sched.tick(t0 + 20ms).status, TickStatus::Wait);
  EXPECT_FALSE(sched.stalled());

  EXPECT_EQ(sched.tick(t0 + 50ms).status, TickStatus::Stall);
  EXPECT_EQ(sched.position(), 40ms);
  EXPECT_EQ(sched.tick(t0 + 500ms).status, TickStatus::Stall);
  EXPECT_EQ(sched.position(), 40ms);
  EXPECT_TRUE(sched.stalled());
  EXPECT_EQ(metrics.stalls.load(), 1u);

  push(1);
  auto resumed = sched.tick(t0 + 600ms);
  ASSERT_EQ(resumed.status, TickStatus::Frame);
  EXPECT_EQ(resumed.frame->seq, 1u);
  EXPECT_FALSE(sched.stalled());
  EXPECT_EQ(metrics.stall_time_us.load(), 550'000);

  // The clock restarted at frame 1, frame 2 follows one frame later
  push(2);
  auto next = sched.tick(t0 + 610ms);
  EXPECT_EQ(next.status, TickStatus::Wait);
  ASSERT_TRUE(next.next_due);
  EXPECT_EQ(*next.next_due, t0 + 640ms);
}

TEST_F(PlaybackSchedulerTest, StaleFramesAreDroppedWhenNewerOnesWait)
{
  auto sched = scheduler(10);
  push(0);
  push(1);
  push(2);

  ASSERT_EQ(sched.tick(t0).status, TickStatus::Frame);

  // Frame 1's slot [40, 80) is over, frame 2's slot [80, 120) has begun
  auto late = sched.tick(t0 + 85ms);
  ASSERT_EQ(late.status, TickStatus::Frame);
  EXPECT_EQ(late.frame->seq, 2u);
  EXPECT_EQ(metrics.frames_dropped.load(), 1u);
  EXPECT_EQ(metrics.frames_presented.load(), 2u);
}

TEST_F(PlaybackSchedulerTest, LastQueuedFrameIsNeverDropped)
{
  auto sched = scheduler(10);
  push(0);
  push(1);
  ASSERT_EQ(sched.tick(t0).status, TickStatus::Frame);

  auto late = sched.tick(t0 + 300ms);
  ASSERT_EQ(late.status, TickStatus::Frame);
  EXPECT_EQ(late.frame->seq, 1u);
  EXPECT_EQ(metrics.frames_dropped.load(), 0u);
}

TEST_F(PlaybackSchedulerTest, MissingFramesAreCounted)
{
  auto sched = scheduler(1);
  auto f     = frame(0);
  f.missing  = true;
  queue.push(std::move(f));
  occupancy.onFrameEnqueued(FRAME);

  ASSERT_EQ(sched.tick(t0).status, TickStatus::Frame);
  EXPECT_EQ(metrics.frames_missing.load(), 1u);
}

TEST_F(PlaybackSchedulerTest, FinishesAfterTheLastFrame)
{
  auto sched = scheduler(2);
  push(0);
  push(1);

  ASSERT_EQ(sched.tick(t0).status, TickStatus::Frame);
  ASSERT_EQ(sched.tick(t0 + 40ms).status, TickStatus::Frame);
  EXPECT_TRUE(sched.finished());
  EXPECT_EQ(sched.tick(t0 + 80ms).status, TickStatus::Finished);
}

TEST(PlaybackQueueTest, RejectsNonContiguousFrames)
{
  PlaybackQueue queue(5);
  EXPECT_THROW(queue.push(frame(4)), std::logic_error);

  queue.push(frame(5));
  EXPECT_THROW(queue.push(frame(7)), std::logic_error);
  EXPECT_EQ(queue.nextExpected(), 6u);
}

TEST(PlaybackQueueTest, ClearReportsDroppedTimeAndCloseWakesWaiters)
{
  PlaybackQueue queue;
  queue.push(frame(0));
  queue.push(frame(1));

  EXPECT_EQ(queue.clear(), 2 * FRAME);
  EXPECT_TRUE(queue.empty());

  queue.close();
  EXPECT_FALSE(queue.waitFor(1s));
  EXPECT_TRUE(queue.closed());
}
