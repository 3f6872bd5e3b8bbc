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

#include <chrono>
#include <condition_variable>
#include <deque>
#include <libvvplay/decoder/interface.hpp>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace libvvplay::playback
{

/*
 * The hand-off between the decode workers and the render loop.
 *
 * Only accepts frames in strictly increasing, contiguous sequence order
 * starting at `first_seq`; anything else is a programming error and throws
 * std::logic_error. Frames are moved in and out whole under the lock, so
 * neither side can observe a partially written frame.
 */
class PlaybackQueue
{
public:
  explicit PlaybackQueue(FrameSeq first_seq = 0) : m_nextPush(first_seq) {}

  PlaybackQueue(const PlaybackQueue&)                    = delete;
  auto operator=(const PlaybackQueue&) -> PlaybackQueue& = delete;

  void push(decoder::DecodedFrame frame)
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (frame.seq != m_nextPush)
      {
        throw std::logic_error("PlaybackQueue expected frame " + std::to_string(m_nextPush) +
                               ", got " + std::to_string(frame.seq));
      }
      ++m_nextPush;
      m_frames.push_back(std::move(frame));
    }
    m_cv.notify_all();
  }

  auto tryPop() -> std::optional<decoder::DecodedFrame>
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frames.empty())
      return std::nullopt;
    auto frame = std::move(m_frames.front());
    m_frames.pop_front();
    return frame;
  }

  // Sequence number and timing of the head frame, without taking it
  struct Head
  {
    FrameSeq      seq;
    MediaTime     pts;
    MediaDuration duration;
  };

  [[nodiscard]] auto head() const -> std::optional<Head>
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frames.empty())
      return std::nullopt;
    const auto& f = m_frames.front();
    return Head{f.seq, f.pts, f.duration};
  }

  // Returns true when a frame is available, false on timeout or close()
  template <typename Rep, typename Period>
  auto waitFor(std::chrono::duration<Rep, Period> timeout) -> bool
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, timeout, [this]() { return !m_frames.empty() || m_closed; });
    return !m_frames.empty() && !m_closed;
  }

  // Wakes every waiter, used on teardown
  void close()
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_cv.notify_all();
  }

  // Drops every queued frame, returns the playback time they covered
  auto clear() -> MediaDuration
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    MediaDuration dropped{0};
    for (const auto& f : m_frames)
      dropped += f.duration;
    m_frames.clear();
    return dropped;
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frames.size();
  }

  [[nodiscard]] auto empty() const -> bool { return size() == 0; }

  [[nodiscard]] auto closed() const -> bool
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
  }

  [[nodiscard]] auto nextExpected() const -> FrameSeq
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nextPush;
  }

private:
  mutable std::mutex                m_mutex;
  std::condition_variable           m_cv;
  std::deque<decoder::DecodedFrame> m_frames;
  FrameSeq                          m_nextPush;
  bool                              m_closed = false;
};

} // namespace libvvplay::playback
