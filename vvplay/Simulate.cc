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

#if __cplusplus < 202002L
#error "VVPlay-Simulate requires C++20 or later."
#endif

#include <iostream>
#include <libvvplay/common/macros.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <libvvplay/sim/simulator.hpp>
#include <libvvplay/tsfetcher/methods/local/entry.hpp>
#include <libvvplay/utils/cmd-line/parser.hpp>
#include <optional>

namespace logger = libvvplay::log;
using Sim        = libvvplay::log::SIM;

using namespace libvvplay;

/*
 * vvdash: replays a manifest over a bandwidth trace in virtual time and
 * prints every ABR decision, stall and the playback totals. No segment is
 * downloaded or decoded, so any MPD works without its media.
 */
auto main(int argc, char* argv[]) -> int
{
  INIT_VVPLAY_LOGGER();

  utils::cmdline::CmdLineParser parser(std::span<char* const>(argv, argc));

  parser.register_args({
    {{"manifest"}, "MPD file to replay"},
    {{"trace"}, "Bandwidth trace file (KB/s per line, one line per second)"},
    {{"bandwidth"}, "Constant link rate in bits/s, instead of --trace"},
    {{"config"}, "TOML player configuration"},
    {{"stepMs"}, "Simulation step in milliseconds (default 1)"},
  });

  try
  {
    if (parser.has("help"))
    {
      parser.print_usage(argv[0]);
      return VVPLAY_RET_SUC;
    }

    const auto manifest_path = parser.get<AbsPath>("manifest");
    const auto trace_path    = parser.get<AbsPath>("trace");
    const auto bandwidth     = parser.get<Bitrate>("bandwidth");
    const auto config_path   = parser.get<AbsPath>("config");
    const auto step_ms       = parser.get_or<i64>("stepMs", 1);

    if (!parser.warn_unknown_args())
    {
      parser.print_usage(argv[0]);
      return VVPLAY_RET_FAIL;
    }

    if (!manifest_path || (!trace_path && !bandwidth) || step_ms <= 0)
    {
      logger::ERROR<Sim>("Usage: --manifest=<file> (--trace=<file> | --bandwidth=<bps>)");
      parser.print_usage(argv[0]);
      return VVPLAY_RET_FAIL;
    }

    config::PlayerConfig cfg;
    if (config_path)
      cfg = config::loadConfig(*config_path);

    if (auto level = logger::parse_log_level(cfg.log.level); level && !logger::log_level_from_env())
      logger::set_log_level(*level);

    const SegmentBuffer raw = fetch::LocalFileTransport::readFile(*manifest_path);
    const auto manifest     = manifest::Manifest::parse(ManifestData(raw.begin(), raw.end()),
                                                        "file://" + *manifest_path);

    auto trace = trace_path ? sim::NetworkTrace::load(*trace_path)
                            : sim::NetworkTrace::constant(*bandwidth);

    logger::INFO<Sim>("Replaying {} segment(s) x {} tier(s) over a {} s trace",
                      manifest.segmentCount(), manifest.representationList().size(),
                      std::chrono::duration_cast<std::chrono::seconds>(trace.duration()).count());

    sim::TraceSimulator simulator(manifest, std::move(trace), cfg, Millis(step_ms));
    const auto          report = simulator.run();

    std::cout << report.toText() << std::flush;

    if (!report.completed)
    {
      logger::WARN<Sim>("Simulation hit its time limit before the last frame");
      return VVPLAY_RET_FAIL;
    }
  }
  catch (const ManifestError& e)
  {
    logger::ERROR<Sim>("Manifest rejected: {}", e.what());
    return VVPLAY_RET_FAIL;
  }
  catch (const ConfigError& e)
  {
    logger::ERROR<Sim>("Configuration error: {}", e.what());
    return VVPLAY_RET_FAIL;
  }
  catch (const std::exception& e)
  {
    logger::ERROR<Sim>("Fatal: {}", e.what());
    return VVPLAY_RET_FAIL;
  }

  logger::flush_logs();
  return VVPLAY_RET_SUC;
}
