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

#include <libvvplay/log-macros.hpp>
#include <libvvplay/logger.hpp>
#include <libvvplay/toml/toml_parser.hpp>
#include <limits>
#include <sstream>

namespace libvvplay::config
{

namespace
{

using NodeView = toml::node_view<const toml::node>;

template <typename T>
auto readValue(const toml::table& table, std::string_view section, std::string_view key)
  -> std::optional<T>
{
  NodeView node = table[section][key];
  if (!node)
    return std::nullopt;

  auto value = node.value<T>();
  if (!value)
  {
    throw ConfigError("Config key '" + std::string(section) + "." + std::string(key) +
                      "' has the wrong type");
  }
  return value;
}

auto readMillis(const toml::table& table, std::string_view section, std::string_view key)
  -> std::optional<Millis>
{
  auto raw = readValue<i64>(table, section, key);
  if (!raw)
    return std::nullopt;
  if (*raw < 0)
    throw ConfigError("Config key '" + std::string(section) + "." + std::string(key) +
                      "' must not be negative");
  return Millis{*raw};
}

auto readCount(const toml::table& table, std::string_view section, std::string_view key)
  -> std::optional<std::size_t>
{
  auto raw = readValue<i64>(table, section, key);
  if (!raw)
    return std::nullopt;
  if (*raw < 0)
    throw ConfigError("Config key '" + std::string(section) + "." + std::string(key) +
                      "' must not be negative");
  return static_cast<std::size_t>(*raw);
}

} // namespace

void applyTomlTable(const toml::table& table, PlayerConfig& config)
{
  namespace K = TomlKeys;

  if (auto v = readValue<double>(table, K::Abr::Root, K::Abr::SafetyFactor))
    config.abr.safety_factor = *v;
  if (auto v = readMillis(table, K::Abr::Root, K::Abr::LowWaterMs))
    config.abr.low_water = *v;
  if (auto v = readMillis(table, K::Abr::Root, K::Abr::HighWaterMs))
    config.abr.high_water = *v;
  if (auto v = readMillis(table, K::Abr::Root, K::Abr::BufferTarget))
    config.abr.buffer_target = *v;
  if (auto v = readCount(table, K::Abr::Root, K::Abr::MaxStepUp))
    config.abr.max_step_up = *v;

  if (auto v = readValue<double>(table, K::Throughput::Root, K::Throughput::Decay))
    config.throughput.decay = *v;

  if (auto v = readCount(table, K::Fetch::Root, K::Fetch::MaxInFlight))
    config.fetch.max_in_flight = *v;
  if (auto v = readValue<i64>(table, K::Fetch::Root, K::Fetch::MaxAttempts))
  {
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
      throw ConfigError("Config key 'fetch.max_attempts' is out of range: " + std::to_string(*v));
    config.fetch.max_attempts = static_cast<int>(*v);
  }
  if (auto v = readMillis(table, K::Fetch::Root, K::Fetch::TimeoutMs))
    config.fetch.timeout = *v;
  if (auto v = readMillis(table, K::Fetch::Root, K::Fetch::BackoffBaseMs))
    config.fetch.backoff_base = *v;
  if (auto v = readMillis(table, K::Fetch::Root, K::Fetch::BackoffCapMs))
    config.fetch.backoff_cap = *v;

  if (auto v = readCount(table, K::Decode::Root, K::Decode::Workers))
    config.decode.workers = *v;

  if (auto v = readMillis(table, K::Playback::Root, K::Playback::StallPollMs))
    config.playback.stall_poll = *v;
  if (auto v = readMillis(table, K::Playback::Root, K::Playback::ControlPollMs))
    config.playback.control_poll = *v;

  if (auto v = readValue<std::string>(table, K::Log::Root, K::Log::Level))
    config.log.level = *v;
}

void PlayerConfig::validate() const
{
  if (!(abr.safety_factor > 0.0 && abr.safety_factor < 1.0))
    throw ConfigError("abr.safety_factor must lie in (0, 1)");
  if (abr.low_water >= abr.high_water)
    throw ConfigError("abr.low_water_ms must be below abr.high_water_ms");
  if (abr.high_water > abr.buffer_target)
    throw ConfigError("abr.high_water_ms must not exceed abr.buffer_target_ms");
  if (abr.max_step_up == 0)
    throw ConfigError("abr.max_step_up must be at least 1");

  if (!(throughput.decay > 0.0 && throughput.decay < 1.0))
    throw ConfigError("throughput.decay must lie in (0, 1)");

  if (fetch.max_in_flight < 1 || fetch.max_in_flight > 8)
    throw ConfigError("fetch.max_in_flight must lie in [1, 8]");
  if (fetch.max_attempts < 1)
    throw ConfigError("fetch.max_attempts must be at least 1");
  if (fetch.timeout <= Millis::zero())
    throw ConfigError("fetch.timeout_ms must be positive");
  if (fetch.backoff_base > fetch.backoff_cap)
    throw ConfigError("fetch.backoff_base_ms must not exceed fetch.backoff_cap_ms");

  if (decode.workers < 1)
    throw ConfigError("decode.workers must be at least 1");

  if (playback.stall_poll <= Millis::zero() || playback.control_poll <= Millis::zero())
    throw ConfigError("playback poll intervals must be positive");

  if (!log::parse_log_level(log.level))
    throw ConfigError("log.level '" + log.level + "' is not a known level");
}

auto parseConfig(std::string_view document) -> PlayerConfig
{
  PlayerConfig config;
  try
  {
    toml::table table = toml::parse(document);
    applyTomlTable(table, config);
  }
  catch (const toml::parse_error& e)
  {
    std::ostringstream oss;
    oss << "Invalid TOML: " << e.description() << " at " << e.source().begin;
    throw ConfigError(oss.str());
  }

  config.validate();
  return config;
}

auto loadConfig(const AbsPath& path) -> PlayerConfig
{
  log::INFO<log::CONFIG>("Loading player configuration from '{}'", path);

  PlayerConfig config;
  try
  {
    toml::table table = toml::parse_file(path);
    applyTomlTable(table, config);
  }
  catch (const toml::parse_error& e)
  {
    std::ostringstream oss;
    oss << "Invalid TOML in '" << path << "': " << e.description() << " at "
        << e.source().begin;
    throw ConfigError(oss.str());
  }

  config.validate();

  log::DBG<log::CONFIG>("ABR: safety={} low={}ms high={}ms target={}ms step={}",
                        config.abr.safety_factor,
                        std::chrono::duration_cast<Millis>(config.abr.low_water).count(),
                        std::chrono::duration_cast<Millis>(config.abr.high_water).count(),
                        std::chrono::duration_cast<Millis>(config.abr.buffer_target).count(),
                        config.abr.max_step_up);
  return config;
}

} // namespace libvvplay::config
