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

#include <cmath>
#include <fstream>
#include <libvvplay/common/error.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/sim/network_trace.hpp>
#include <sstream>

namespace libvvplay::sim
{

namespace
{
constexpr double BYTES_PER_KB = 1000.0;
}

NetworkTrace::NetworkTrace(std::vector<double> kilobytes_per_sec, MediaDuration interval)
    : m_kBps(std::move(kilobytes_per_sec)), m_interval(interval)
{
  if (m_kBps.empty())
    throw Error("Network trace has no samples");
  if (m_interval <= MediaDuration::zero())
    throw Error("Network trace interval must be positive");
  for (double v : m_kBps)
  {
    if (!std::isfinite(v) || v < 0.0)
      throw Error("Network trace samples must be finite and non-negative");
  }
}

auto NetworkTrace::load(const AbsPath& path) -> NetworkTrace
{
  std::ifstream in(path);
  if (!in)
    throw Error("Cannot open network trace '" + path + "'");

  auto trace = parse(in);
  log::INFO<log::SIM>("Loaded network trace '{}': {} sample(s)", path, trace.samples().size());
  return trace;
}

auto NetworkTrace::parse(std::istream& in) -> NetworkTrace
{
  std::vector<double> samples;
  std::string         line;
  std::size_t         line_no = 0;

  while (std::getline(in, line))
  {
    ++line_no;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#')
      continue;

    std::istringstream iss(line.substr(first));
    double             value = 0.0;
    std::string        rest;
    if (!(iss >> value) || (iss >> rest))
      throw Error("Malformed network trace line " + std::to_string(line_no) + ": '" + line + "'");
    samples.push_back(value);
  }

  return NetworkTrace(std::move(samples));
}

auto NetworkTrace::constant(Bitrate bits_per_sec) -> NetworkTrace
{
  return NetworkTrace({static_cast<double>(bits_per_sec) / BITS_PER_BYTE / BYTES_PER_KB});
}

auto NetworkTrace::sampleIndex(MediaTime t) const -> std::size_t
{
  if (t <= MediaTime::zero())
    return 0;
  const auto idx = static_cast<std::size_t>(t / m_interval);
  return std::min(idx, m_kBps.size() - 1);
}

auto NetworkTrace::bandwidthAt(MediaTime t) const -> double
{
  return m_kBps[sampleIndex(t)] * BYTES_PER_KB;
}

auto NetworkTrace::transferFinish(MediaTime start, ByteCount bytes) const
  -> std::optional<MediaTime>
{
  using Seconds = std::chrono::duration<double>;

  double       remaining = static_cast<double>(bytes);
  double       now       = Seconds(std::max(start, MediaTime::zero())).count();
  const double step      = Seconds(m_interval).count();

  if (remaining <= 0.0)
    return std::chrono::duration_cast<MediaTime>(Seconds(now));

  auto idx = std::min(static_cast<std::size_t>(now / step), m_kBps.size() - 1);
  while (true)
  {
    const double rate = m_kBps[idx] * BYTES_PER_KB;

    if (idx == m_kBps.size() - 1)
    {
      if (rate <= 0.0)
        return std::nullopt;
      now += remaining / rate;
      break;
    }

    const double boundary = static_cast<double>(idx + 1) * step;
    const double capacity = rate * std::max(boundary - now, 0.0);
    if (rate > 0.0 && capacity >= remaining)
    {
      now += remaining / rate;
      break;
    }

    remaining -= capacity;
    now = boundary;
    ++idx;
  }

  // Round up to whole microseconds, ignoring floating point noise
  return MediaTime(static_cast<i64>(std::ceil(now * 1e6 - 1e-3)));
}

} // namespace libvvplay::sim
