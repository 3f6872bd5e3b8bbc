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

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <libvvplay/config/entry.hpp>

using namespace libvvplay;
using namespace libvvplay::config;
using namespace std::chrono_literals;

TEST(PlayerConfigTest, DefaultsAreValid)
{
  PlayerConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_DOUBLE_EQ(cfg.abr.safety_factor, 0.9);
  EXPECT_EQ(cfg.abr.low_water, 2s);
  EXPECT_EQ(cfg.abr.high_water, 6s);
  EXPECT_EQ(cfg.fetch.max_in_flight, 2u);
  EXPECT_EQ(cfg.fetch.max_attempts, 4);
}

TEST(PlayerConfigTest, DocumentOverridesDefaults)
{
  const auto cfg = parseConfig(R"(
[abr]
safety_factor = 0.8
low_water_ms = 1500
buffer_target_ms = 12000

[fetch]
max_in_flight = 3
timeout_ms = 2500

[decode]
workers = 4

[log]
level = "debug"
)");

  EXPECT_DOUBLE_EQ(cfg.abr.safety_factor, 0.8);
  EXPECT_EQ(cfg.abr.low_water, 1500ms);
  EXPECT_EQ(cfg.abr.high_water, 6s);
  EXPECT_EQ(cfg.abr.buffer_target, 12s);
  EXPECT_EQ(cfg.fetch.max_in_flight, 3u);
  EXPECT_EQ(cfg.fetch.timeout, 2500ms);
  EXPECT_EQ(cfg.decode.workers, 4u);
  EXPECT_EQ(cfg.log.level, "debug");
}

TEST(PlayerConfigTest, WrongTypeIsAConfigError)
{
  EXPECT_THROW(parseConfig("[fetch]\nmax_in_flight = \"many\"\n"), ConfigError);
}

TEST(PlayerConfigTest, SyntaxErrorIsAConfigError)
{
  EXPECT_THROW(parseConfig("[abr\nsafety_factor = "), ConfigError);
}

TEST(PlayerConfigTest, NegativeDurationsAreRejected)
{
  EXPECT_THROW(parseConfig("[abr]\nlow_water_ms = -5\n"), ConfigError);
}

TEST(PlayerConfigTest, AttemptCountBeyondIntIsRejectedNotWrapped)
{
  // 2^32 + 1 would narrow to 1 and pass validation
  EXPECT_THROW(parseConfig("[fetch]\nmax_attempts = 4294967297\n"), ConfigError);
  EXPECT_THROW(parseConfig("[fetch]\nmax_attempts = -4294967295\n"), ConfigError);
  EXPECT_EQ(parseConfig("[fetch]\nmax_attempts = 7\n").fetch.max_attempts, 7);
}

TEST(PlayerConfigTest, ValidateRejectsInconsistentWaterMarks)
{
  PlayerConfig cfg;
  cfg.abr.low_water  = 7s;
  cfg.abr.high_water = 6s;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg                   = PlayerConfig{};
  cfg.abr.high_water    = 11s;
  cfg.abr.buffer_target = 10s;
  EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST(PlayerConfigTest, ValidateRejectsOutOfRangeValues)
{
  PlayerConfig cfg;
  cfg.abr.safety_factor = 1.0;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg                     = PlayerConfig{};
  cfg.fetch.max_in_flight = 9;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg                    = PlayerConfig{};
  cfg.fetch.max_attempts = 0;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg                    = PlayerConfig{};
  cfg.fetch.backoff_base = 5s;
  cfg.fetch.backoff_cap  = 1s;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg                = PlayerConfig{};
  cfg.decode.workers = 0;
  EXPECT_THROW(cfg.validate(), ConfigError);

  cfg           = PlayerConfig{};
  cfg.log.level = "chatty";
  EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST(PlayerConfigTest, LoadsFromFile)
{
  const auto path = std::filesystem::temp_directory_path() / "vvplay_test_config.toml";
  {
    std::ofstream out(path);
    out << "[throughput]\ndecay = 0.75\n[playback]\nstall_poll_ms = 10\n";
  }

  const auto cfg = loadConfig(path.string());
  EXPECT_DOUBLE_EQ(cfg.throughput.decay, 0.75);
  EXPECT_EQ(cfg.playback.stall_poll, 10ms);

  std::filesystem::remove(path);
}

TEST(PlayerConfigTest, MissingFileIsAConfigError)
{
  EXPECT_THROW(loadConfig("/nonexistent/vvplay.toml"), ConfigError);
}
