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

#include <libvvplay/abrate/ABRManager.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <libvvplay/playback/metrics.hpp>
#include <libvvplay/sim/network_trace.hpp>
#include <string>
#include <vector>

namespace libvvplay::sim
{

struct SegmentDecision
{
  SegmentIndex        index{};
  RepIdx              representation{};
  RepresentationID    representation_id;
  abr::DecisionReason reason{};
  double              estimate_bps{};
  MediaDuration       occupancy{};
  MediaTime           issued{};
  MediaTime           completed{};
  int                 attempts = 0;
  bool                unavailable = false; // retries exhausted, placeholders were played
};

struct StallInterval
{
  MediaTime start{};
  MediaTime end{}; // end of the run when playback was still stalled
};

struct SimulationReport
{
  std::vector<SegmentDecision> decisions; // in issue order, fallbacks included
  std::vector<StallInterval>   stalls;
  ui64                         frames_presented = 0;
  ui64                         frames_dropped   = 0;
  ui64                         frames_missing   = 0;
  ui64                         bytes_downloaded = 0;
  std::size_t                  abr_switches     = 0;
  MediaTime                    startup_delay{};
  MediaTime                    finished_at{};
  bool                         completed = false;

  [[nodiscard]] auto totalStallTime() const -> MediaDuration;
  [[nodiscard]] auto toText() const -> std::string;
};

/*
 * TRACE SIMULATOR
 *
 * Replays a manifest over a NetworkTrace in virtual time, in fixed steps, with
 * the same ThroughputEstimator, BufferOccupancy, ABRManager, PlaybackQueue and
 * PlaybackScheduler the player uses. One fetch is in flight at a time, each
 * segment weighs bandwidth * duration / 8 bytes, decoding is instant, fetch
 * attempts time out and back off exactly like the fetch scheduler's.
 *
 * Deterministic: the same inputs always produce the same report.
 */
class VVPLAY_API TraceSimulator
{
public:
  TraceSimulator(const manifest::Manifest& manifest, NetworkTrace trace, config::PlayerConfig cfg,
                 MediaDuration step = std::chrono::milliseconds(1));

  auto run() -> SimulationReport;

  // Payload size the simulator charges for one segment of `rep`
  static auto segmentBytes(const manifest::Representation&   rep,
                           const manifest::SegmentReference& ref) -> ByteCount;

private:
  const manifest::Manifest& m_manifest;
  NetworkTrace              m_trace;
  config::PlayerConfig      m_cfg;
  MediaDuration             m_step;
};

} // namespace libvvplay::sim
