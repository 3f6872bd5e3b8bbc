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

#include <algorithm>
#include <chrono>
#include <libvvplay/common/types.hpp>
#include <libvvplay/log-macros.hpp>
#include <stdexcept>

namespace libvvplay::abr
{

// One completed segment transfer. Consumed by the estimator, never stored.
struct ThroughputSample
{
  ByteCount                bytes{};
  std::chrono::nanoseconds elapsed{};
};

/*
 * THROUGHPUT ESTIMATOR
 *
 * Byte-weighted harmonic estimate of the sustainable download rate:
 *
 *   B <- decay * B + bytes
 *   T <- decay * T + seconds
 *   estimate = 8 * B / T
 *
 * Every sample contributes in proportion to its size, so a tiny fetch that
 * was served from a cache in a fraction of a millisecond barely moves the
 * estimate, and a single large outlier is damped by the accumulated history.
 * Feeding identical samples yields exactly that sample's rate.
 *
 * Before the first sample the estimator returns the cold start rate, which
 * the caller sets to the lowest Representation's bitrate.
 */
class ThroughputEstimator
{
public:
  explicit ThroughputEstimator(Bitrate cold_start_bps, double decay = 0.9)
      : m_coldStart(cold_start_bps), m_decay(decay)
  {
    if (!(decay > 0.0 && decay < 1.0))
      throw std::invalid_argument("Throughput decay must lie in (0, 1)");
  }

  void record(const ThroughputSample& sample)
  {
    if (sample.bytes == 0)
    {
      log::TRACE<log::ABR>("Ignoring empty throughput sample");
      return;
    }

    // Sub-microsecond transfers are clamped so the rate stays finite
    const auto   elapsed = std::max(sample.elapsed, std::chrono::nanoseconds(MIN_ELAPSED_NS));
    const double seconds = std::chrono::duration<double>(elapsed).count();

    m_weightedBytes   = m_decay * m_weightedBytes + static_cast<double>(sample.bytes);
    m_weightedSeconds = m_decay * m_weightedSeconds + seconds;
    ++m_samples;

    log::DBG<log::ABR>("Throughput sample: {} bytes in {:.3f} ms -> estimate {:.0f} bps",
                       sample.bytes, seconds * 1e3, estimate());
  }

  // Bits per second
  [[nodiscard]] auto estimate() const -> double
  {
    if (m_samples == 0 || m_weightedSeconds <= 0.0)
      return static_cast<double>(m_coldStart);
    return BITS_PER_BYTE * m_weightedBytes / m_weightedSeconds;
  }

  [[nodiscard]] auto hasSamples() const -> bool { return m_samples > 0; }
  [[nodiscard]] auto sampleCount() const -> std::size_t { return m_samples; }

  void setColdStart(Bitrate bps) { m_coldStart = bps; }

  void reset()
  {
    m_weightedBytes   = 0.0;
    m_weightedSeconds = 0.0;
    m_samples         = 0;
  }

private:
  static constexpr i64 MIN_ELAPSED_NS = 1000;

  Bitrate     m_coldStart;
  double      m_decay;
  double      m_weightedBytes   = 0.0;
  double      m_weightedSeconds = 0.0;
  std::size_t m_samples         = 0;
};

} // namespace libvvplay::abr
