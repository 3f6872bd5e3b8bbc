#pragma once
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

#include <libvvplay/abrate/BufferOccupancy.hpp>
#include <libvvplay/playback/metrics.hpp>
#include <libvvplay/playback/queue.hpp>
#include <optional>

namespace libvvplay::playback
{

enum class TickStatus
{
  Frame,   // `frame` is due now, present it
  Wait,    // nothing due yet, check again by `next_due`
  Stall,   // the next frame is due but has not been decoded, playback is paused
  Finished // every frame of the stream has been presented or dropped
};

inline auto to_string(TickStatus status) -> const char*
{
  switch (status)
  {
    case TickStatus::Frame:
      return "frame";
    case TickStatus::Wait:
      return "wait";
    case TickStatus::Stall:
      return "stall";
    case TickStatus::Finished:
      return "finished";
  }
  return "unknown";
}

struct TickResult
{
  TickStatus                           status = TickStatus::Wait;
  std::optional<decoder::DecodedFrame> frame;
  std::optional<TimePoint>             next_due; // set for Wait when a frame is queued
};

/*
 * PLAYBACK SCHEDULER (render clock)
 *
 * Maps presentation timestamps onto a monotonic wall clock. The clock is
 * anchored on the first presented frame and re-anchored when playback
 * resumes after a stall, so media time never advances while stalled and
 * the frame that ends a stall is shown at its own timestamp.
 *
 * Frames whose whole display interval has already passed are dropped (and
 * logged) as long as a later frame is queued behind them.
 *
 * Driven by a single thread, the render loop, or by the simulator.
 */
class VVPLAY_API PlaybackScheduler
{
public:
  PlaybackScheduler(PlaybackQueue& queue, abr::BufferOccupancy& occupancy,
                    PlaybackMetrics& metrics, FrameCount total_frames, FrameSeq first_seq = 0);

  auto tick(TimePoint now) -> TickResult;

  [[nodiscard]] auto stalled() const -> bool { return m_stalled; }
  [[nodiscard]] auto started() const -> bool { return m_started; }
  // Presentation time of the next frame to show, frozen while stalled
  [[nodiscard]] auto position() const -> MediaTime { return m_nextPts; }
  [[nodiscard]] auto nextSequence() const -> FrameSeq { return m_nextSeq; }
  [[nodiscard]] auto finished() const -> bool { return m_nextSeq >= m_endSeq; }

private:
  PlaybackQueue&        m_queue;
  abr::BufferOccupancy& m_occupancy;
  PlaybackMetrics&      m_metrics;
  FrameSeq              m_nextSeq;
  FrameSeq              m_endSeq;

  bool      m_started = false;
  bool      m_stalled = false;
  TimePoint m_anchorWall{};
  MediaTime m_anchorPts{0};
  MediaTime m_nextPts{0};
  TimePoint m_stallStart{};

  [[nodiscard]] auto dueAt(MediaTime pts) const -> TimePoint
  {
    return m_anchorWall + (pts - m_anchorPts);
  }

  void anchor(TimePoint now, MediaTime pts);
  auto take(bool dropped) -> decoder::DecodedFrame;
};

} // namespace libvvplay::playback
