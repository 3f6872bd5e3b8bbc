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

#include <libvvplay/log-macros.hpp>
#include <libvvplay/playback/entry.hpp>

namespace libvvplay::playback
{

PlaybackScheduler::PlaybackScheduler(PlaybackQueue& queue, abr::BufferOccupancy& occupancy,
                                     PlaybackMetrics& metrics, FrameCount total_frames,
                                     FrameSeq first_seq)
    : m_queue(queue), m_occupancy(occupancy), m_metrics(metrics), m_nextSeq(first_seq),
      m_endSeq(first_seq + total_frames)
{
}

void PlaybackScheduler::anchor(TimePoint now, MediaTime pts)
{
  m_anchorWall = now;
  m_anchorPts  = pts;
}

auto PlaybackScheduler::take(bool dropped) -> decoder::DecodedFrame
{
  auto frame = m_queue.tryPop();
  if (!frame || frame->seq != m_nextSeq)
    throw std::logic_error("Playback queue head changed under the scheduler");

  m_occupancy.onFrameConsumed(frame->duration);
  m_metrics.buffer_us = m_occupancy.occupancy().count();

  ++m_nextSeq;
  m_nextPts = frame->pts + frame->duration;

  if (dropped)
  {
    ++m_metrics.frames_dropped;
    log::WARN<log::PLAYBACK>(LogMode::Async, "Dropped stale frame {} (pts {} ms)", frame->seq,
                             std::chrono::duration_cast<Millis>(frame->pts).count());
  }
  else
  {
    ++m_metrics.frames_presented;
    if (frame->missing)
      ++m_metrics.frames_missing;
  }
  return std::move(*frame);
}

auto PlaybackScheduler::tick(TimePoint now) -> TickResult
{
  TickResult result;

  if (finished())
  {
    result.status = TickStatus::Finished;
    return result;
  }

  auto head = m_queue.head();

  if (!head)
  {
    // Startup is waiting, not stalling: the clock only runs once anchored
    if (!m_started || now < dueAt(m_nextPts))
    {
      result.status = TickStatus::Wait;
      return result;
    }

    if (!m_stalled)
    {
      m_stalled    = true;
      m_stallStart = now;
      ++m_metrics.stalls;
      log::WARN<log::PLAYBACK>(LogMode::Async, "Stall: frame {} (pts {} ms) due but not decoded",
                               m_nextSeq, std::chrono::duration_cast<Millis>(m_nextPts).count());
    }
    result.status = TickStatus::Stall;
    return result;
  }

  if (head->seq != m_nextSeq)
  {
    throw std::logic_error("Playback queue head is frame " + std::to_string(head->seq) +
                           ", expected " + std::to_string(m_nextSeq));
  }

  if (!m_started)
  {
    m_started = true;
    anchor(now, head->pts);
    log::INFO<log::PLAYBACK>(LogMode::Async, "Playback started at frame {}", head->seq);
  }
  else if (m_stalled)
  {
    m_stalled = false;
    m_metrics.addStallTime(std::chrono::duration_cast<MediaDuration>(now - m_stallStart));
    anchor(now, head->pts);
    log::INFO<log::PLAYBACK>(LogMode::Async, "Resumed at frame {} after {} ms", head->seq,
                             std::chrono::duration_cast<Millis>(now - m_stallStart).count());
  }

  // Skip frames whose display slot is already over while newer ones wait behind them
  while (head && now >= dueAt(head->pts + head->duration) && m_queue.size() > 1)
  {
    take(true);
    if (finished())
    {
      result.status = TickStatus::Finished;
      return result;
    }
    head = m_queue.head();
  }

  if (!head || now < dueAt(head->pts))
  {
    result.status = TickStatus::Wait;
    if (head)
      result.next_due = dueAt(head->pts);
    return result;
  }

  result.status = TickStatus::Frame;
  result.frame  = take(false);
  return result;
}

} // namespace libvvplay::playback
