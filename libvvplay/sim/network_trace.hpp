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

#include <iosfwd>
#include <libvvplay/common/api/entry.hpp>
#include <libvvplay/common/types.hpp>
#include <optional>
#include <vector>

namespace libvvplay::sim
{

/*
 * Piecewise-constant link bandwidth over time.
 *
 * The text format is one sample per line, in kilobytes per second
 * (1 KB = 1000 bytes), each sample covering `interval` (1 s by default).
 * Blank lines and lines starting with '#' are skipped. Past the last sample
 * the last value holds forever.
 */
class VVPLAY_API NetworkTrace
{
public:
  explicit NetworkTrace(std::vector<double> kilobytes_per_sec,
                        MediaDuration       interval = std::chrono::seconds(1));

  // Throws libvvplay::Error on unreadable files or malformed lines
  static auto load(const AbsPath& path) -> NetworkTrace;
  static auto parse(std::istream& in) -> NetworkTrace;

  static auto constant(Bitrate bits_per_sec) -> NetworkTrace;

  // Bytes per second available at `t`
  [[nodiscard]] auto bandwidthAt(MediaTime t) const -> double;

  // Time at which `bytes` started at `start` have fully arrived, or
  // std::nullopt when the link never delivers them (a zero tail).
  [[nodiscard]] auto transferFinish(MediaTime start, ByteCount bytes) const
    -> std::optional<MediaTime>;

  [[nodiscard]] auto interval() const -> MediaDuration { return m_interval; }
  [[nodiscard]] auto samples() const -> const std::vector<double>& { return m_kBps; }
  [[nodiscard]] auto duration() const -> MediaDuration
  {
    return m_interval * static_cast<i64>(m_kBps.size());
  }

private:
  std::vector<double> m_kBps;
  MediaDuration       m_interval;

  [[nodiscard]] auto sampleIndex(MediaTime t) const -> std::size_t;
};

} // namespace libvvplay::sim
