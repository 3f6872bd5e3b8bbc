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
#include <gtest/gtest.h>
#include <libvvplay/sim/simulator.hpp>

using namespace libvvplay;
using namespace libvvplay::sim;
using namespace std::chrono_literals;

namespace
{

auto ladder(const std::vector<Bitrate>& bitrates, std::size_t segments) -> manifest::Manifest
{
  std::vector<manifest::Representation> reps;
  for (auto bps : bitrates)
  {
    manifest::Representation rep;
    rep.id        = "q" + std::to_string(bps / 1'000'000);
    rep.bandwidth = bps;
    for (std::size_t i = 0; i < segments; ++i)
    {
      manifest::SegmentReference ref;
      ref.duration = 1s;
      ref.url      = rep.id + "/seg_" + std::to_string(i) + ".vvs";
      rep.segments.push_back(ref);
    }
    reps.push_back(std::move(rep));
  }
  return manifest::Manifest::fromRepresentations(std::move(reps), 30.0);
}

auto ms(MediaTime t) -> double { return std::chrono::duration<double, std::milli>(t).count(); }

} // namespace

TEST(TraceSimulatorTest, SegmentWeightFollowsNominalBitrate)
{
  const auto m = ladder({1'000'000, 4'000'000}, 1);
  EXPECT_EQ(TraceSimulator::segmentBytes(m.lowest(), m.lowest().segments[0]), 125'000u);
  EXPECT_EQ(TraceSimulator::segmentBytes(m.highest(), m.highest().segments[0]), 500'000u);
}

TEST(TraceSimulatorTest, SteadyLinkBelowUpperTierNeverStalls)
{
  const auto m = ladder({1'000'000, 4'000'000}, 10);

  TraceSimulator sim(m, NetworkTrace::constant(2'000'000), config::PlayerConfig{});
  const auto     report = sim.run();

  ASSERT_TRUE(report.completed);
  ASSERT_EQ(report.decisions.size(), 10u);
  EXPECT_EQ(report.decisions[0].reason, abr::DecisionReason::LowBuffer);
  for (const auto& d : report.decisions)
  {
    EXPECT_EQ(d.representation, 0u);
    EXPECT_EQ(d.attempts, 1);
  }

  EXPECT_TRUE(report.stalls.empty());
  EXPECT_EQ(report.frames_presented, 300u);
  EXPECT_EQ(report.frames_dropped, 0u);
  EXPECT_EQ(report.bytes_downloaded, 10u * 125'000u);
  EXPECT_EQ(report.startup_delay, MediaTime(500ms));
  EXPECT_EQ(report.abr_switches, 0u);
}

TEST(TraceSimulatorTest, OutageCausesOneStallAndAnUnderrunDowngrade)
{
  const auto m = ladder({1'000'000, 4'000'000}, 10);

  std::vector<double> kBps = {250, 250, 250, 0, 0, 0, 0, 0};
  kBps.resize(30, 250);

  TraceSimulator sim(m, NetworkTrace(kBps), config::PlayerConfig{});
  const auto     report = sim.run();

  ASSERT_TRUE(report.completed);
  ASSERT_EQ(report.stalls.size(), 1u);
  EXPECT_NEAR(ms(report.stalls[0].start), 6500.0, 2.0);
  EXPECT_NEAR(ms(report.stalls[0].end), 8700.0, 2.0);

  // Segment 6 left at 3 s into the outage, timed out at 8 s and was retried
  ASSERT_GE(report.decisions.size(), 8u);
  EXPECT_EQ(report.decisions[6].attempts, 2);
  EXPECT_FALSE(report.decisions[6].unavailable);
  EXPECT_EQ(report.decisions[7].reason, abr::DecisionReason::Underrun);
  EXPECT_EQ(report.decisions[7].representation, 0u);

  EXPECT_EQ(report.frames_presented, 300u);
  EXPECT_EQ(report.frames_missing, 0u);
  EXPECT_NEAR(ms(report.totalStallTime()), 2200.0, 4.0);
}

TEST(TraceSimulatorTest, FastLinkStepsUpOneTierAtATime)
{
  const auto m = ladder({1'000'000, 2'000'000, 4'000'000}, 20);

  TraceSimulator sim(m, NetworkTrace::constant(20'000'000), config::PlayerConfig{});
  const auto     report = sim.run();

  ASSERT_TRUE(report.completed);
  EXPECT_TRUE(report.stalls.empty());

  RepIdx previous = 0;
  bool   stepped  = false;
  for (const auto& d : report.decisions)
  {
    EXPECT_LE(d.representation, previous + 1);
    EXPECT_GE(d.representation, previous);
    stepped  = stepped || d.reason == abr::DecisionReason::StepUp;
    previous = d.representation;
  }
  EXPECT_TRUE(stepped);
  EXPECT_EQ(report.decisions.back().representation, 2u);
  EXPECT_EQ(report.abr_switches, 2u);
}

TEST(TraceSimulatorTest, DeadLinkPlaysPlaceholders)
{
  const auto m = ladder({1'000'000}, 3);

  config::PlayerConfig cfg;
  cfg.fetch.max_attempts = 2;
  cfg.fetch.timeout      = 1000ms;
  cfg.fetch.backoff_base = 100ms;

  TraceSimulator sim(m, NetworkTrace({250, 0}), cfg);
  const auto     report = sim.run();

  ASSERT_TRUE(report.completed);
  ASSERT_EQ(report.decisions.size(), 3u);
  EXPECT_TRUE(report.decisions[2].unavailable);
  EXPECT_EQ(report.decisions[2].attempts, 2);
  EXPECT_EQ(report.frames_missing, 30u);
  EXPECT_EQ(report.frames_presented, 90u);
  ASSERT_EQ(report.stalls.size(), 1u);
  EXPECT_NEAR(ms(report.stalls[0].start), 2500.0, 2.0);
  EXPECT_NEAR(ms(report.stalls[0].end), 3100.0, 2.0);
}

TEST(TraceSimulatorTest, SameInputsSameReport)
{
  const auto m = ladder({1'000'000, 4'000'000}, 5);

  TraceSimulator a(m, NetworkTrace({300, 100, 600}), config::PlayerConfig{});
  TraceSimulator b(m, NetworkTrace({300, 100, 600}), config::PlayerConfig{});

  EXPECT_EQ(a.run().toText(), b.run().toText());
}

TEST(TraceSimulatorTest, RejectsInvalidConfiguration)
{
  const auto           m = ladder({1'000'000}, 1);
  config::PlayerConfig cfg;
  cfg.abr.safety_factor = 2.0;

  EXPECT_THROW((TraceSimulator(m, NetworkTrace::constant(1), cfg)), ConfigError);
  EXPECT_THROW((TraceSimulator(m, NetworkTrace::constant(1), config::PlayerConfig{}, 0ms)),
               std::invalid_argument);
}

TEST(TraceSimulatorTest, UnavailableUpperTierFallsBackToTheLowestTier)
{
  const auto m = ladder({1'000'000, 2'000'000}, 20);

  config::PlayerConfig cfg;
  cfg.fetch.max_attempts = 2;
  cfg.fetch.timeout      = 1000ms;
  cfg.fetch.backoff_base = 100ms;

  // 16 Mbps builds the buffer and steps up, then 1.6 Mbps: a 2 Mbps segment
  // needs 1.25 s and times out, a 1 Mbps one makes it in 625 ms
  std::vector<double> kBps = {2000, 2000, 2000};
  kBps.resize(40, 200);

  TraceSimulator sim(m, NetworkTrace(kBps), cfg);
  const auto     report = sim.run();

  ASSERT_TRUE(report.completed);

  std::size_t fallbacks = 0;
  for (std::size_t i = 0; i < report.decisions.size(); ++i)
  {
    const auto& d = report.decisions[i];
    if (!d.unavailable)
      continue;

    EXPECT_EQ(d.representation, 1u);
    EXPECT_EQ(d.attempts, 2);

    // the same segment again, at the lowest tier, and it arrives
    ASSERT_LT(i + 1, report.decisions.size());
    const auto& retry = report.decisions[i + 1];
    EXPECT_EQ(retry.index, d.index);
    EXPECT_EQ(retry.representation, 0u);
    EXPECT_EQ(retry.reason, abr::DecisionReason::FetchFailure);
    EXPECT_FALSE(retry.unavailable);
    EXPECT_GE(retry.issued, d.completed);
    ++fallbacks;
  }

  EXPECT_GE(fallbacks, 1u);
  EXPECT_EQ(report.frames_missing, 0u);
  EXPECT_EQ(report.frames_presented + report.frames_dropped, 600u);
}
