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
#include <cctype>
#include <charconv>
#include <iostream>
#include <libvvplay/common/api/entry.hpp>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libvvplay::utils::cmdline
{

struct CmdArg
{
  std::vector<std::string> keys;
  std::string              description;

  CmdArg(std::initializer_list<std::string> k, std::string desc)
      : keys(k), description(std::move(desc))
  {
  }
};

/*
 * `--key=value` and `--flag` style arguments. Values are converted on
 * access; a value that does not convert raises std::invalid_argument naming
 * the key.
 */
class CmdLineParser
{
public:
  explicit CmdLineParser(std::span<char* const> argv)
  {
    for (std::size_t i = 1; i < argv.size(); ++i)
    {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h")
      {
        m_args["help"] = "true";
        continue;
      }

      if (!arg.starts_with("--"))
        throw std::invalid_argument("Invalid argument format: " + arg);

      const auto eq_pos = arg.find('=');
      if (eq_pos != std::string::npos)
        m_args[arg.substr(2, eq_pos - 2)] = arg.substr(eq_pos + 1);
      else
        m_args[arg.substr(2)] = "true"; // boolean flag
    }
  }

  void register_args(std::initializer_list<CmdArg> args)
  {
    for (const auto& a : args)
      m_registeredArgs.push_back(a);
  }

  template <typename T> auto get(const std::string& key) const -> std::optional<T>
  {
    m_accessedKeys.insert(key);
    auto it = m_args.find(key);
    if (it == m_args.end())
      return std::nullopt;

    auto value = parse_value<T>(it->second);
    if (!value)
      throw std::invalid_argument("Bad value for --" + key + ": '" + it->second + "'");
    return value;
  }

  template <typename T> auto get_or(const std::string& key, T fallback) const -> T
  {
    return get<T>(key).value_or(fallback);
  }

  [[nodiscard]] auto has(const std::string& key) const -> bool
  {
    m_accessedKeys.insert(key);
    return m_args.contains(key);
  }

  [[nodiscard]] auto get_bool(const std::string& key, bool default_value = false) const -> bool
  {
    m_accessedKeys.insert(key);
    auto it = m_args.find(key);
    if (it == m_args.end())
      return default_value;

    std::string val = it->second;
    std::ranges::transform(val, val.begin(), [](unsigned char c) { return std::tolower(c); });
    return val == "true" || val == "1" || val == "yes";
  }

  // Returns false when an argument was given that nothing asked for
  [[nodiscard]] auto warn_unknown_args() const -> bool
  {
    bool clean = true;
    for (const auto& [key, val] : m_args)
    {
      if (!m_accessedKeys.contains(key))
      {
        std::cerr << "[CLI] Unrecognized or unused CLI argument: --" << key
                  << (val != "true" ? ("=" + val) : "") << "\n";
        clean = false;
      }
    }
    return clean;
  }

  void print_usage(std::string_view program) const
  {
    std::cerr << "Usage: " << program << " [options]\n";
    for (const auto& arg : m_registeredArgs)
    {
      std::string aliases;
      for (const auto& k : arg.keys)
        aliases += "--" + k + ", ";
      if (!aliases.empty())
        aliases.erase(aliases.size() - 2); // Remove trailing comma+space

      std::cerr << "  " << aliases << "\n      " << arg.description << "\n";
    }
  }

private:
  std::map<std::string, std::string> m_args;
  mutable std::set<std::string>      m_accessedKeys;
  std::vector<CmdArg>                m_registeredArgs;

  template <typename T> static auto parse_value(const std::string& s) -> std::optional<T>
  {
    if constexpr (std::is_same_v<T, std::string>)
    {
      return s;
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      return s == "true" || s == "1";
    }
    else if constexpr (std::is_integral_v<T>)
    {
      T out{};
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      if (ec == std::errc() && ptr == s.data() + s.size())
        return out;
      return std::nullopt;
    }
    else
    {
      std::istringstream iss(s);
      T                  out{};
      iss >> out;
      if (!iss.fail() && iss.eof())
        return out;
      return std::nullopt;
    }
  }
};

} // namespace libvvplay::utils::cmdline
