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

#include <libvvplay/common/error.hpp>
#include <libvvplay/common/types.hpp>
#include <libvvplay/log-macros.hpp>
#include <mutex>

namespace libvvplay::abr
{

enum class UnderflowPolicy
{
  Throw,      // fail loudly, used by tests and debug builds
  LogAndClamp // log the violation and clamp at zero
};

constexpr auto defaultUnderflowPolicy() -> UnderflowPolicy
{
#ifdef NDEBUG
  return UnderflowPolicy::LogAndClamp;
#else
  return UnderflowPolicy::Throw;
#endif
}

/*
 * Playback time that has been decoded but not yet presented.
 *
 * Shared by the decode workers (enqueue side) and the render loop (consume
 * side), and read by the control loop for ABR decisions. The decode pipeline
 * and playback scheduler both receive a reference to the same instance.
 */
class BufferOccupancy
{
public:
  explicit BufferOccupancy(UnderflowPolicy policy = defaultUnderflowPolicy()) : m_policy(policy) {}

  BufferOccupancy(const BufferOccupancy&)                    = delete;
  auto operator=(const BufferOccupancy&) -> BufferOccupancy& = delete;

  [[nodiscard]] auto occupancy() const -> MediaDuration
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queued;
  }

  void onFrameEnqueued(MediaDuration duration)
  {
    if (duration < MediaDuration::zero())
      throw std::invalid_argument("Enqueued frame duration must not be negative");

    std::lock_guard<std::mutex> lock(m_mutex);
    m_queued += duration;
  }

  void onFrameConsumed(MediaDuration duration)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (duration > m_queued)
    {
      const auto queued = m_queued.count();
      if (m_policy == UnderflowPolicy::Throw)
      {
        throw BufferUnderflowError("Consumed " + std::to_string(duration.count()) +
                                   "us with only " + std::to_string(queued) + "us queued");
      }

      log::ERROR<log::PLAYBACK>("Buffer underflow: consumed {}us with only {}us queued, clamping",
                                duration.count(), queued);
      m_queued = MediaDuration::zero();
      return;
    }
    m_queued -= duration;
  }

  void reset()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queued = MediaDuration::zero();
  }

  [[nodiscard]] auto policy() const -> UnderflowPolicy { return m_policy; }

private:
  mutable std::mutex m_mutex;
  MediaDuration      m_queued{0};
  UnderflowPolicy    m_policy;
};

} // namespace libvvplay::abr
