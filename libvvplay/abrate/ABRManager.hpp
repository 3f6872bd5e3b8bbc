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
#include <libvvplay/abrate/BufferOccupancy.hpp>
#include <libvvplay/abrate/ThroughputEstimator.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <optional>
#include <vector>

namespace libvvplay::abr
{

enum class DecisionReason
{
  LowBuffer,       // occupancy under the low-water mark
  Underrun,        // a stall was reported since the last decision
  DecodeFailure,   // a segment failed to decode since the last decision
  FetchFailure,    // a segment could not be fetched since the last decision
  StepUp,          // throughput allows more, buffer is healthy, one step at a time
  Hold,            // throughput allows more but the buffer is not healthy enough
  ThroughputBound, // the highest tier the estimate supports (includes downswitches)
};

inline auto to_string(DecisionReason reason) -> const char*
{
  switch (reason)
  {
    case DecisionReason::LowBuffer:
      return "low-buffer";
    case DecisionReason::Underrun:
      return "underrun";
    case DecisionReason::DecodeFailure:
      return "decode-failure";
    case DecisionReason::FetchFailure:
      return "fetch-failure";
    case DecisionReason::StepUp:
      return "step-up";
    case DecisionReason::Hold:
      return "hold";
    case DecisionReason::ThroughputBound:
      return "throughput-bound";
  }
  return "unknown";
}

struct AbrDecision
{
  RepIdx         chosen{};
  RepIdx         bound{}; // highest tier under estimate * safety_factor
  DecisionReason reason{DecisionReason::LowBuffer};
  double         estimate_bps{};
  MediaDuration  occupancy{};
};

/*
 * ABR MANAGER
 *
 * Buffer-aware hybrid quality selection, invoked once per upcoming segment
 * right before its fetch is issued:
 *
 *  1. bound = highest Representation with bandwidth <= estimate * safety_factor
 *  2. occupancy < low water, or a stall or failure was reported since the
 *     last decision
 *       -> lowest Representation
 *  3. bound > last
 *       -> occupancy >= high water: step up, at most `max_step_up` tiers
 *       -> otherwise hold at last
 *  4. otherwise -> bound (downswitches are immediate)
 *
 * Representations must be ascending by bandwidth (Manifest guarantees it),
 * so comparing tiers is comparing indices and the highest qualifying index
 * wins ties.
 *
 * Owned by the control loop, not thread-safe.
 */
class ABRManager
{
public:
  explicit ABRManager(config::AbrConfig cfg) : m_cfg(cfg) {}

  auto selectNext(const std::vector<manifest::Representation>& reps, double throughput_estimate,
                  MediaDuration buffer_occupancy, MediaDuration buffer_target,
                  std::optional<RepIdx> last_choice) -> const manifest::Representation&
  {
    if (reps.empty())
      throw std::invalid_argument("ABR decision requested without Representations");

    const RepIdx top   = reps.size() - 1;
    const RepIdx last  = std::min(last_choice.value_or(0), top);
    const RepIdx bound = throughputBound(reps, throughput_estimate);

    AbrDecision decision{};
    decision.bound        = bound;
    decision.estimate_bps = throughput_estimate;
    decision.occupancy    = buffer_occupancy;

    const MediaDuration high_water = std::min(m_cfg.high_water, buffer_target);

    if (m_pendingPenalty)
    {
      decision.chosen = 0;
      decision.reason = *m_pendingPenalty;
      m_pendingPenalty.reset();
    }
    else if (buffer_occupancy < m_cfg.low_water)
    {
      decision.chosen = 0;
      decision.reason = DecisionReason::LowBuffer;
    }
    else if (bound > last)
    {
      if (buffer_occupancy >= high_water)
      {
        decision.chosen = std::min(bound, last + m_cfg.max_step_up);
        decision.reason = DecisionReason::StepUp;
      }
      else
      {
        decision.chosen = last;
        decision.reason = DecisionReason::Hold;
      }
    }
    else
    {
      decision.chosen = bound;
      decision.reason = DecisionReason::ThroughputBound;
    }

    if (last_choice && decision.chosen != *last_choice)
    {
      ++m_switches;
      log::INFO<log::ABR>("Switching '{}' -> '{}' ({}): estimate {:.0f} bps, buffer {} ms",
                          reps[last].id, reps[decision.chosen].id, to_string(decision.reason),
                          throughput_estimate,
                          std::chrono::duration_cast<Millis>(buffer_occupancy).count());
    }
    else
    {
      log::DBG<log::ABR>("Selected '{}' ({}): estimate {:.0f} bps, buffer {} ms",
                         reps[decision.chosen].id, to_string(decision.reason), throughput_estimate,
                         std::chrono::duration_cast<Millis>(buffer_occupancy).count());
    }

    m_lastDecision = decision;
    return reps[decision.chosen];
  }

  // A stall is a strong downgrade signal, the next decision goes to the lowest tier
  void reportUnderrun() { m_pendingPenalty = DecisionReason::Underrun; }

  void reportDecodeFailure()
  {
    if (!m_pendingPenalty)
      m_pendingPenalty = DecisionReason::DecodeFailure;
  }

  void reportFetchFailure()
  {
    if (!m_pendingPenalty)
      m_pendingPenalty = DecisionReason::FetchFailure;
  }

  [[nodiscard]] auto lastDecision() const -> const std::optional<AbrDecision>&
  {
    return m_lastDecision;
  }
  [[nodiscard]] auto switchCount() const -> std::size_t { return m_switches; }
  [[nodiscard]] auto config() const -> const config::AbrConfig& { return m_cfg; }

  [[nodiscard]] auto throughputBound(const std::vector<manifest::Representation>& reps,
                                     double throughput_estimate) const -> RepIdx
  {
    const double budget = throughput_estimate * m_cfg.safety_factor;

    RepIdx bound = 0;
    for (RepIdx i = 0; i < reps.size(); ++i)
    {
      if (static_cast<double>(reps[i].bandwidth) <= budget)
        bound = i;
    }
    return bound;
  }

private:
  config::AbrConfig             m_cfg;
  std::optional<DecisionReason> m_pendingPenalty;
  std::optional<AbrDecision>    m_lastDecision;
  std::size_t                   m_switches = 0;
};

} // namespace libvvplay::abr
