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
#include <iomanip>
#include <libvvplay/common/types.hpp>
#include <libvvplay/utils/math/entry.hpp>
#include <sstream>
#include <string>

namespace libvvplay::playback
{

// Observability only, nothing in the control loop depends on these except
// `stalls`, which the render side bumps and the ABR side watches.
struct PlaybackMetrics
{
  std::atomic<RepIdx> current_representation{0};
  std::atomic<i64>    buffer_us{0};

  std::atomic<ui64> stalls{0};
  std::atomic<i64>  stall_time_us{0};
  std::atomic<ui64> frames_presented{0};
  std::atomic<ui64> frames_dropped{0};
  std::atomic<ui64> frames_missing{0};

  std::atomic<ui64> bytes_downloaded{0};
  std::atomic<ui64> segments_downloaded{0};
  std::atomic<ui64> segments_unavailable{0};
  std::atomic<ui64> decode_failures{0};
  std::atomic<ui64> abr_switches{0};

  void addStallTime(MediaDuration d) { stall_time_us += d.count(); }
};

class MetricsSerializer
{
public:
  static auto toText(const PlaybackMetrics& m) -> std::string
  {
    std::ostringstream out;

    auto line = [&](const std::string& name, const std::string& value)
    { out << "  " << std::left << std::setw(24) << name << value << "\n"; };

    line("representation", std::to_string(m.current_representation.load()));
    line("buffer", utils::math::secondsFormat(MediaDuration(m.buffer_us.load())));
    line("stalls", std::to_string(m.stalls.load()));
    line("stall time", utils::math::secondsFormat(MediaDuration(m.stall_time_us.load())));
    line("frames presented", std::to_string(m.frames_presented.load()));
    line("frames dropped", std::to_string(m.frames_dropped.load()));
    line("frames missing", std::to_string(m.frames_missing.load()));
    line("downloaded", utils::math::bytesFormat(m.bytes_downloaded.load()));
    line("segments downloaded", std::to_string(m.segments_downloaded.load()));
    line("segments unavailable", std::to_string(m.segments_unavailable.load()));
    line("decode failures", std::to_string(m.decode_failures.load()));
    line("abr switches", std::to_string(m.abr_switches.load()));

    return out.str();
  }
};

} // namespace libvvplay::playback
