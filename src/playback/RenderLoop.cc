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
#include <libvvplay/playback/render_loop.hpp>

namespace libvvplay::playback
{

RenderLoop::RenderLoop(PlaybackScheduler& scheduler, PlaybackQueue& queue, IFrameSink& sink,
                       const config::PlaybackConfig& cfg)
    : m_scheduler(scheduler), m_queue(queue), m_sink(sink), m_cfg(cfg)
{
}

RenderLoop::~RenderLoop() { stop(); }

void RenderLoop::start()
{
  if (m_thread.joinable())
    return;

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopRequested = false;
  }
  m_running = true;
  m_thread  = std::thread([this]() { run(); });
}

void RenderLoop::stop()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopRequested = true;
  }
  m_cv.notify_all();
  m_queue.close();

  if (m_thread.joinable())
    m_thread.join();
  m_running = false;
}

auto RenderLoop::sleepUntil(TimePoint deadline) -> bool
{
  std::unique_lock<std::mutex> lock(m_mutex);
  return !m_cv.wait_until(lock, deadline, [this]() { return m_stopRequested; });
}

auto RenderLoop::step(bool& was_stalled) -> bool
{
  auto tick = m_scheduler.tick(SteadyClock::now());

  switch (tick.status)
  {
    case TickStatus::Frame:
      if (was_stalled)
      {
        was_stalled = false;
        m_sink.onResume(tick.frame->seq);
      }
      m_sink.present(*tick.frame);
      return true;

    case TickStatus::Wait:
      if (tick.next_due)
        return sleepUntil(*tick.next_due);
      m_queue.waitFor(m_cfg.stall_poll);
      return true;

    case TickStatus::Stall:
      if (!was_stalled)
      {
        was_stalled = true;
        m_sink.onStall(m_scheduler.nextSequence());
      }
      m_queue.waitFor(m_cfg.stall_poll);
      return true;

    case TickStatus::Finished:
      log::INFO<log::PLAYBACK>(LogMode::Async, "End of stream");
      m_sink.onEndOfStream();
      if (m_onFinished)
        m_onFinished();
      return false;
  }
  return true;
}

void RenderLoop::run()
{
  log::DBG<log::PLAYBACK>(LogMode::Async, "Render loop running");

  bool was_stalled = false;

  while (true)
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      if (m_stopRequested)
        break;
    }

    try
    {
      if (!step(was_stalled))
        break;
    }
    catch (const std::exception& e)
    {
      log::ERROR<log::PLAYBACK>(LogMode::Async, "Render loop aborted: {}", e.what());
      m_error = std::current_exception();
      if (m_onFinished)
        m_onFinished();
      break;
    }
  }

  m_running = false;
  log::DBG<log::PLAYBACK>(LogMode::Async, "Render loop stopped");
}

} // namespace libvvplay::playback
