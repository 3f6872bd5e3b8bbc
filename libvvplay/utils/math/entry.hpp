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

#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

enum ByteTable : std::size_t
{
  ONE_KIB = 1024,
  ONE_MIB = ONE_KIB * ONE_KIB,
  ONE_GIB = ONE_MIB * ONE_KIB
};

namespace libvvplay::utils::math
{

inline auto formatSize(double size, const std::string& unit) -> std::string
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << size << " " << unit;
  return oss.str();
}

inline auto bytesFormat(std::size_t bytes) -> std::string
{
  static constexpr std::array<const char*, 4> units    = {"B", "KiB", "MiB", "GiB"};
  static constexpr std::array<std::size_t, 4> divisors = {1, ONE_KIB, ONE_MIB, ONE_GIB};

  for (std::size_t i = 0; i + 1 < units.size(); ++i)
  {
    if (bytes < divisors[i + 1])
      return formatSize(static_cast<double>(bytes) / divisors[i], units[i]);
  }

  return formatSize(static_cast<double>(bytes) / divisors[3], units[3]);
}

// Decimal units, the way link rates are quoted
inline auto bitrateFormat(double bits_per_sec) -> std::string
{
  static constexpr std::array<const char*, 4> units = {"bps", "kbps", "Mbps", "Gbps"};

  std::size_t i = 0;
  while (bits_per_sec >= 1000.0 && i + 1 < units.size())
  {
    bits_per_sec /= 1000.0;
    ++i;
  }
  return formatSize(bits_per_sec, units[i]);
}

template <typename Rep, typename Period>
inline auto secondsFormat(std::chrono::duration<Rep, Period> d) -> std::string
{
  return formatSize(std::chrono::duration<double>(d).count(), "s");
}

} // namespace libvvplay::utils::math
