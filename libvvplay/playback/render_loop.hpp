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

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/playback/entry.hpp>
#include <libvvplay/playback/sink.hpp>
#include <mutex>
#include <thread>

namespace libvvplay::playback
{

/*
 * The single pacing thread: ticks the PlaybackScheduler, hands frames to the
 * sink and sleeps until the next frame is due. While stalled or starting up
 * it re-checks every `stall_poll`, waking early when a frame lands in the
 * queue. It blocks only on the queue and its own stop signal.
 */
class VVPLAY_API RenderLoop
{
public:
  RenderLoop(PlaybackScheduler& scheduler, PlaybackQueue& queue, IFrameSink& sink,
             const config::PlaybackConfig& cfg);
  ~RenderLoop();

  RenderLoop(const RenderLoop&)                    = delete;
  auto operator=(const RenderLoop&) -> RenderLoop& = delete;

  // Called once, from the render thread, when the stream has ended or the
  // loop died on an exception (see error())
  void onFinished(std::function<void()> callback) { m_onFinished = std::move(callback); }

  void start();
  // Idempotent, joins the thread
  void stop();

  [[nodiscard]] auto running() const -> bool { return m_running.load(); }
  // Set when the loop terminated on an exception, read after stop()
  [[nodiscard]] auto error() const -> std::exception_ptr { return m_error; }

private:
  PlaybackScheduler&     m_scheduler;
  PlaybackQueue&         m_queue;
  IFrameSink&            m_sink;
  config::PlaybackConfig m_cfg;
  std::function<void()>  m_onFinished;

  std::thread             m_thread;
  std::atomic<bool>       m_running{false};
  std::mutex              m_mutex;
  std::condition_variable m_cv;
  bool                    m_stopRequested = false;
  std::exception_ptr      m_error;

  void run();
  // One tick and its side effects on the sink, false ends the loop
  auto step(bool& was_stalled) -> bool;
  // false when a stop was requested
  auto sleepUntil(TimePoint deadline) -> bool;
};

} // namespace libvvplay::playback
