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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/regex.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <libvvplay/logger.hpp>
#include <map>
#include <mutex>
#include <sstream>

namespace libvvplay::log
{

auto strip_ansi(const std::string& input) -> std::string
{
  static const boost::regex ansi_regex(ANSI_REGEX);
  return boost::regex_replace(input, ansi_regex, "");
}

auto get_current_timestamp() -> std::string
{
  using namespace std::chrono;

  const auto        now    = system_clock::now();
  const auto        now_ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t t      = system_clock::to_time_t(now);
  std::tm           local{};
  localtime_r(&t, &local);

  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << now_ms.count();
  return oss.str();
}

void init_logging()
{
  namespace bfs     = boost::filesystem;
  namespace logging = boost::log;
  namespace trivial = boost::log::trivial;
  namespace sinks   = boost::log::sinks;
  namespace expr    = boost::log::expressions;
  namespace kw      = boost::log::keywords;
  using expr::stream;

  using Severity = trivial::severity_level;

  static std::once_flag initialized;
  std::call_once(
    initialized,
    []
    {
      auto L_ConsoleFormatter = []
      {
        return stream << BOLD << "[" << expr::format_date_time<boost::posix_time::ptime>(
                                          "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                      << "] "
                      << expr::if_(expr::attr<Severity>("Severity") ==
                                   trivial::trace)[stream << PURPLE << "[TRACE]   "]
                      << expr::if_(expr::attr<Severity>("Severity") ==
                                   trivial::info)[stream << GREEN << "[INFO]    "]
                      << expr::if_(expr::attr<Severity>("Severity") ==
                                   trivial::warning)[stream << YELLOW << "[WARN]    "]
                      << expr::if_(expr::attr<Severity>("Severity") ==
                                   trivial::error)[stream << RED << "[ERROR]   "]
                      << expr::if_(expr::attr<Severity>("Severity") ==
                                   trivial::debug)[stream << BLUE << "[DEBUG]   "]
                      << RESET << expr::smessage;
      };

      logging::add_console_log(std::cout, kw::format = L_ConsoleFormatter());
      boost::log::add_common_attributes();

      const char* home = std::getenv("HOME");
      if (!home)
      {
        std::cerr << "ERROR: Unable to determine HOME directory, file logging disabled.\n";
        return;
      }

      bfs::path                 log_dir = bfs::path(home) / REL_PATH_LOGS;
      boost::system::error_code ec;
      if (!bfs::exists(log_dir, ec) && !bfs::create_directories(log_dir, ec))
      {
        std::cerr << "ERROR: Failed to create log directory: " << log_dir.string() << " ("
                  << ec.message() << ")" << std::endl;
        return;
      }

      const std::string log_file = (log_dir / "vvplay_%Y-%m-%d_%H-%M-%S.log").string();

      // File logging (without ANSI codes)
      using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      boost::shared_ptr<text_sink> file_sink =
        boost::make_shared<text_sink>(kw::file_name     = log_file,
                                      kw::rotation_size = 10 * 1024 * 1024, // 10 MB
                                      kw::auto_flush    = true);

      file_sink->set_formatter(
        [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm)
        {
          auto        severity    = rec[trivial::severity];
          auto        message_ref = rec[expr::smessage];
          std::string message     = message_ref ? message_ref.get() : "";

          strm << "[" << get_current_timestamp() << "] "
               << (severity ? severity.get() : trivial::info) << " " << strip_ansi(message);
        });

      boost::log::core::get()->add_sink(file_sink);
    });

  if (auto env_level = log_level_from_env())
    set_log_level(*env_level);
}

void flush_logs() { boost::log::core::get()->flush(); }

void set_log_level(SeverityLevel level)
{
  namespace trivial = boost::log::trivial;

  static const std::map<SeverityLevel, trivial::severity_level> level_map = {
    {SeverityLevel::ERROR, trivial::error}, {SeverityLevel::WARNING, trivial::warning},
    {SeverityLevel::TRACE, trivial::trace}, {SeverityLevel::INFO, trivial::info},
    {SeverityLevel::DEBUG, trivial::debug},
  };

  auto it = level_map.find(level);
  if (it != level_map.end())
  {
    boost::log::core::get()->set_filter(trivial::severity >= it->second);
  }
  else
  {
    std::cerr << "Unknown log level specified.\n";
  }
}

auto parse_log_level(const std::string& name) -> std::optional<SeverityLevel>
{
  static const std::map<std::string, SeverityLevel> name_map = {
    {"error", SeverityLevel::ERROR}, {"warn", SeverityLevel::WARNING},
    {"warning", SeverityLevel::WARNING}, {"trace", SeverityLevel::TRACE},
    {"info", SeverityLevel::INFO},   {"debug", SeverityLevel::DEBUG},
  };

  auto it = name_map.find(boost::algorithm::to_lower_copy(name));
  if (it == name_map.end())
    return std::nullopt;
  return it->second;
}

auto log_level_from_env() -> std::optional<SeverityLevel>
{
  const char* value = std::getenv(LOG_LEVEL_ENV);
  if (!value)
    return std::nullopt;
  return parse_log_level(value);
}

} // namespace libvvplay::log
