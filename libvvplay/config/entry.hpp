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
#include <libvvplay/common/api/entry.hpp>
#include <libvvplay/common/error.hpp>
#include <libvvplay/common/types.hpp>
#include <string>

namespace libvvplay::config
{

using namespace std::chrono_literals;

// Buffer-aware hybrid ABR tuning. Water marks are measured in queued playback time.
struct AbrConfig
{
  double        safety_factor = 0.9;
  MediaDuration low_water     = 2s;
  MediaDuration high_water    = 6s;
  MediaDuration buffer_target = 10s;
  std::size_t   max_step_up   = 1;
};

struct ThroughputConfig
{
  // Per-sample decay of the byte-weighted history, (0, 1). Larger is smoother.
  double decay = 0.9;
};

struct FetchConfig
{
  std::size_t max_in_flight = 2;
  int         max_attempts  = 4;
  Millis      timeout{5000};
  Millis      backoff_base{200};
  Millis      backoff_cap{4000};
};

struct DecodeConfig
{
  std::size_t workers = 2;
};

struct PlaybackConfig
{
  Millis stall_poll{5};    // render loop re-check interval while stalled
  Millis control_poll{50}; // control loop re-check interval while the buffer is full
};

struct LogConfig
{
  std::string level = "info";
};

struct PlayerConfig
{
  AbrConfig        abr;
  ThroughputConfig throughput;
  FetchConfig      fetch;
  DecodeConfig     decode;
  PlaybackConfig   playback;
  LogConfig        log;

  // Throws ConfigError describing the first violated constraint
  void validate() const;
};

// Reads a TOML file on top of the defaults, then validates. Throws ConfigError.
VVPLAY_API auto loadConfig(const AbsPath& path) -> PlayerConfig;

// Same as loadConfig but from an in-memory document
VVPLAY_API auto parseConfig(std::string_view document) -> PlayerConfig;

} // namespace libvvplay::config
