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

#include <libvvplay/config/entry.hpp>
#include <toml++/toml.hpp>

namespace TomlKeys
{
namespace Abr
{
inline constexpr auto Root         = "abr";
inline constexpr auto SafetyFactor = "safety_factor";
inline constexpr auto LowWaterMs   = "low_water_ms";
inline constexpr auto HighWaterMs  = "high_water_ms";
inline constexpr auto BufferTarget = "buffer_target_ms";
inline constexpr auto MaxStepUp    = "max_step_up";
} // namespace Abr

namespace Throughput
{
inline constexpr auto Root  = "throughput";
inline constexpr auto Decay = "decay";
} // namespace Throughput

namespace Fetch
{
inline constexpr auto Root          = "fetch";
inline constexpr auto MaxInFlight   = "max_in_flight";
inline constexpr auto MaxAttempts   = "max_attempts";
inline constexpr auto TimeoutMs     = "timeout_ms";
inline constexpr auto BackoffBaseMs = "backoff_base_ms";
inline constexpr auto BackoffCapMs  = "backoff_cap_ms";
} // namespace Fetch

namespace Decode
{
inline constexpr auto Root    = "decode";
inline constexpr auto Workers = "workers";
} // namespace Decode

namespace Playback
{
inline constexpr auto Root          = "playback";
inline constexpr auto StallPollMs   = "stall_poll_ms";
inline constexpr auto ControlPollMs = "control_poll_ms";
} // namespace Playback

namespace Log
{
inline constexpr auto Root  = "log";
inline constexpr auto Level = "level";
} // namespace Log
} // namespace TomlKeys

namespace libvvplay::config
{

// Populates `config` from `table`. Missing keys keep their current value,
// present keys of the wrong type raise ConfigError.
void applyTomlTable(const toml::table& table, PlayerConfig& config);

} // namespace libvvplay::config
