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

#include <iomanip>
#include <libvvplay/decoder/entry.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/playback/entry.hpp>
#include <libvvplay/sim/simulator.hpp>
#include <libvvplay/tsfetcher/entry.hpp>
#include <libvvplay/utils/math/entry.hpp>
#include <sstream>

namespace libvvplay::sim
{

namespace
{

struct Transfer
{
  std::size_t              decision{}; // index into SimulationReport::decisions
  RepIdx                   rep{};
  SegmentIndex             index{};
  ByteCount                bytes{};
  bool                     fallback = false;
  int                      attempts = 0;
  MediaTime                attempt_start{};
  MediaTime                done_at{};
  bool                     on_time = false;
  std::optional<MediaTime> retry_at;
};

auto toMillis(MediaDuration d) -> double { return std::chrono::duration<double, std::milli>(d).count(); }

} // namespace

TraceSimulator::TraceSimulator(const manifest::Manifest& manifest, NetworkTrace trace,
                               config::PlayerConfig cfg, MediaDuration step)
    : m_manifest(manifest), m_trace(std::move(trace)), m_cfg(std::move(cfg)), m_step(step)
{
  if (m_step <= MediaDuration::zero())
    throw std::invalid_argument("Simulation step must be positive");
  m_cfg.validate();
}

auto TraceSimulator::segmentBytes(const manifest::Representation&   rep,
                                  const manifest::SegmentReference& ref) -> ByteCount
{
  const double seconds = std::chrono::duration<double>(ref.duration).count();
  return static_cast<ByteCount>(static_cast<double>(rep.bandwidth) * seconds / BITS_PER_BYTE);
}

auto TraceSimulator::run() -> SimulationReport
{
  SimulationReport report;

  const auto& reps     = m_manifest.representationList();
  const auto  segments = m_manifest.segmentCount();
  const auto  retry    = fetch::RetryPolicy::fromConfig(m_cfg.fetch);
  const auto  timeout  = std::chrono::duration_cast<MediaDuration>(m_cfg.fetch.timeout);
  const auto  target   = m_cfg.abr.buffer_target;

  abr::BufferOccupancy        occupancy(abr::UnderflowPolicy::Throw);
  playback::PlaybackQueue     queue(0);
  playback::PlaybackMetrics   metrics;
  playback::PlaybackScheduler clock(queue, occupancy, metrics, m_manifest.totalFrames(), 0);
  abr::ThroughputEstimator    estimator(m_manifest.lowest().bandwidth, m_cfg.throughput.decay);
  abr::ABRManager             abr(m_cfg.abr);
  decoder::ReorderBuffer      reorder(0);

  std::optional<Transfer>  active;
  SegmentIndex             next = 0;
  std::optional<RepIdx>    last;
  ui64                     seen_stalls = 0;
  bool                     started     = false;
  std::optional<MediaTime> stall_start;

  auto start_attempt = [&](Transfer& t, MediaTime now)
  {
    ++t.attempts;
    t.attempt_start = now;
    t.retry_at.reset();

    const auto finish   = m_trace.transferFinish(now, t.bytes);
    const auto deadline = now + timeout;
    t.on_time           = finish && *finish <= deadline;
    t.done_at           = t.on_time ? *finish : deadline;
  };

  auto begin = [&](SegmentIndex index, RepIdx rep, MediaTime now, bool fallback,
                   abr::DecisionReason reason)
  {
    const auto& ref = reps[rep].segments[index];

    SegmentDecision d;
    d.index             = index;
    d.representation    = rep;
    d.representation_id = reps[rep].id;
    d.reason            = reason;
    d.estimate_bps      = estimator.estimate();
    d.occupancy         = occupancy.occupancy();
    d.issued            = now;
    report.decisions.push_back(d);

    Transfer t;
    t.decision = report.decisions.size() - 1;
    t.rep      = rep;
    t.index    = index;
    t.bytes    = segmentBytes(reps[rep], ref);
    t.fallback = fallback;
    start_attempt(t, now);
    active = t;
  };

  // Instant decode: stamp the segment's frames and release them in order
  auto deliver = [&](SegmentIndex index, const RepresentationID& rep_id, bool missing)
  {
    const auto& ref = reps.front().segments[index];
    for (std::size_t i = 0; i < ref.frame_count; ++i)
    {
      decoder::DecodedFrame f;
      f.seq                       = ref.first_frame + i;
      std::tie(f.pts, f.duration) = decoder::DecodePipeline::frameTiming(ref, i);
      f.segment                   = index;
      f.representation            = rep_id;
      f.missing                   = missing;
      reorder.insert(std::move(f));
    }
    for (auto& f : reorder.releaseReady())
    {
      occupancy.onFrameEnqueued(f.duration);
      queue.push(std::move(f));
    }
  };

  const auto worst_fetch = m_cfg.fetch.max_attempts * 2 *
                           std::chrono::duration_cast<MediaDuration>(m_cfg.fetch.timeout +
                                                                     m_cfg.fetch.backoff_cap);
  const MediaTime limit = m_manifest.totalDuration() * 4 +
                          worst_fetch * static_cast<i64>(segments) + std::chrono::seconds(10);

  log::INFO<log::SIM>("Simulating {} segment(s) x {} Representation(s) over a {} s trace",
                      segments, reps.size(),
                      std::chrono::duration_cast<std::chrono::seconds>(m_trace.duration()).count());

  MediaTime now{0};
  bool      done = false;
  for (; now <= limit && !done; now += m_step)
  {
    // 1. Network
    if (active)
    {
      if (active->retry_at)
      {
        if (now >= *active->retry_at)
          start_attempt(*active, now);
      }
      else if (now >= active->done_at)
      {
        auto& d    = report.decisions[active->decision];
        d.attempts = active->attempts;

        if (active->on_time)
        {
          d.completed = active->done_at;
          estimator.record({active->bytes, active->done_at - active->attempt_start});
          report.bytes_downloaded += active->bytes;
          deliver(active->index, reps[active->rep].id, false);
          active.reset();
        }
        else if (active->attempts < retry.max_attempts)
        {
          const auto delay   = retry.backoff(active->attempts);
          active->retry_at   = now + delay;
          log::DBG<log::SIM>("[{:.0f} ms] segment {} attempt {} timed out, retry in {} ms",
                             toMillis(now), active->index, active->attempts, delay.count());
        }
        else
        {
          d.completed   = now;
          d.unavailable = true;
          abr.reportFetchFailure();

          const auto index = active->index;
          if (!active->fallback && active->rep != 0)
          {
            log::WARN<log::SIM>("[{:.0f} ms] segment {} unavailable at '{}', falling back to '{}'",
                                toMillis(now), index, reps[active->rep].id, reps.front().id);
            begin(index, 0, now, true, abr::DecisionReason::FetchFailure);
          }
          else
          {
            log::WARN<log::SIM>("[{:.0f} ms] segment {} unavailable, playing placeholders",
                                toMillis(now), index);
            deliver(index, reps[active->rep].id, true);
            active.reset();
          }
        }
      }
    }

    // 2. Playback
    const TimePoint wall = TimePoint{} + now;
    while (true)
    {
      auto tick = clock.tick(wall);
      if (tick.status == playback::TickStatus::Frame)
      {
        if (!started)
        {
          started              = true;
          report.startup_delay = now;
        }
        if (stall_start)
        {
          report.stalls.push_back({*stall_start, now});
          stall_start.reset();
        }
        continue;
      }
      if (tick.status == playback::TickStatus::Stall && !stall_start)
        stall_start = now;
      if (tick.status == playback::TickStatus::Finished)
        done = true;
      break;
    }
    if (done)
      break;

    // 3. Control
    const auto stalls = metrics.stalls.load();
    if (stalls > seen_stalls)
    {
      seen_stalls = stalls;
      abr.reportUnderrun();
    }

    if (!active && next < segments && occupancy.occupancy() < target)
    {
      abr.selectNext(reps, estimator.estimate(), occupancy.occupancy(), target, last);
      const auto& decision = *abr.lastDecision();
      last                 = decision.chosen;
      begin(next, decision.chosen, now, false, decision.reason);
      ++next;
    }
  }

  if (stall_start)
    report.stalls.push_back({*stall_start, now});

  report.completed        = done;
  report.finished_at      = now;
  report.frames_presented = metrics.frames_presented.load();
  report.frames_dropped   = metrics.frames_dropped.load();
  report.frames_missing   = metrics.frames_missing.load();
  report.abr_switches     = abr.switchCount();

  log::INFO<log::SIM>("Simulation {} at {:.0f} ms: {} stall(s), {} switch(es)",
                      done ? "finished" : "gave up", toMillis(now), report.stalls.size(),
                      report.abr_switches);
  return report;
}

auto SimulationReport::totalStallTime() const -> MediaDuration
{
  MediaDuration total{0};
  for (const auto& s : stalls)
    total += s.end - s.start;
  return total;
}

auto SimulationReport::toText() const -> std::string
{
  std::ostringstream out;
  out << std::fixed << std::setprecision(3);

  out << std::left << std::setw(6) << "seg" << std::setw(14) << "rep" << std::setw(18) << "reason"
      << std::setw(14) << "estimate" << std::setw(10) << "buffer" << std::setw(10) << "issued"
      << std::setw(10) << "done" << "tries\n";

  auto secs = [](MediaDuration d) { return std::chrono::duration<double>(d).count(); };

  for (const auto& d : decisions)
  {
    out << std::setw(6) << d.index << std::setw(14) << d.representation_id << std::setw(18)
        << abr::to_string(d.reason) << std::setw(14) << utils::math::bitrateFormat(d.estimate_bps)
        << std::setw(10) << secs(d.occupancy) << std::setw(10) << secs(d.issued) << std::setw(10)
        << secs(d.completed) << d.attempts << (d.unavailable ? " unavailable" : "") << "\n";
  }

  out << "\nstartup delay   " << secs(startup_delay) << " s\n";
  out << "stalls          " << stalls.size() << " (" << secs(totalStallTime()) << " s)\n";
  for (const auto& s : stalls)
    out << "  " << secs(s.start) << " s -> " << secs(s.end) << " s\n";
  out << "frames          " << frames_presented << " presented, " << frames_dropped
      << " dropped, " << frames_missing << " missing\n";
  out << "downloaded      " << utils::math::bytesFormat(bytes_downloaded) << "\n";
  out << "abr switches    " << abr_switches << "\n";
  out << "completed       " << (completed ? "yes" : "no") << " at " << secs(finished_at) << " s\n";

  return out.str();
}

} // namespace libvvplay::sim
