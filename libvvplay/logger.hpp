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

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/thread.hpp>
#include <optional>
#include <string>

#include <libvvplay/common/api/entry.hpp>

/*
 * LOGGER
 *
 * This is a logging header that neatly wraps around boost logger
 *
 * Gives up-to-date logs with SeverityLevel and time information, printed
 * to the console in color and mirrored (uncolored) to a rotating file
 * under $HOME/.cache/vvplay/logs
 *
 */

// Force ANSI Colors (Ignoring Terminal Themes)
#define RESET  "\033[0m\033[39m\033[49m" // Reset all styles and colors
#define BOLD   "\033[1m"                 // Bold text
#define RED    "\033[38;5;124m"          // Gruvbox Red (#cc241d)
#define GREEN  "\033[38;5;142m"          // Gruvbox Green (#98971a)
#define YELLOW "\033[38;5;214m"          // Gruvbox Yellow (#d79921)
#define BLUE   "\033[38;5;109m"          // Gruvbox Blue (#458588)
#define PURPLE "\033[38;5;141m"          // Gruvbox Purple (#b16286) -> For TRACE logs

constexpr const char* ANSI_REGEX     = "\033\\[[0-9;]*m";
constexpr const char* REL_PATH_LOGS  = ".cache/vvplay/logs";
constexpr const char* LOG_LEVEL_ENV  = "VVPLAY_LOG_LEVEL";

#define FILENAME \
  (__builtin_strrchr(__FILE__, '/') ? __builtin_strrchr(__FILE__, '/') + 1 : __FILE__)

namespace libvvplay::log
{

// In priority order
enum class SeverityLevel
{
  ERROR,
  WARNING,
  TRACE,
  INFO,
  DEBUG
};

VVPLAY_API auto strip_ansi(const std::string& input) -> std::string;
VVPLAY_API auto get_current_timestamp() -> std::string;

// Console + file sinks. Safe to call more than once; later calls are no-ops.
VVPLAY_API void init_logging();
VVPLAY_API void flush_logs();
VVPLAY_API void set_log_level(SeverityLevel level);

// Accepts "error", "warn", "trace", "info", "debug" (case-insensitive).
VVPLAY_API auto parse_log_level(const std::string& name) -> std::optional<SeverityLevel>;

// Reads VVPLAY_LOG_LEVEL, returns std::nullopt when unset or unknown.
VVPLAY_API auto log_level_from_env() -> std::optional<SeverityLevel>;

// Macros for logging
#define THREAD_ID    BOLD << "[Worker " << boost::this_thread::get_id() << "] " << RESET
#define _TRACE_BACK_ "[" << FILENAME << ":" << __LINE__ << " - " << __func__ << "] "

#define LOG_TRACE   BOOST_LOG_TRIVIAL(trace) << _TRACE_BACK_
#define LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define LOG_ERROR   BOOST_LOG_TRIVIAL(error) << _TRACE_BACK_
#define LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)

// Async logging macros (include thread ID)
#define LOG_TRACE_ASYNC   BOOST_LOG_TRIVIAL(trace) << THREAD_ID << _TRACE_BACK_
#define LOG_INFO_ASYNC    BOOST_LOG_TRIVIAL(info) << THREAD_ID
#define LOG_WARNING_ASYNC BOOST_LOG_TRIVIAL(warning) << THREAD_ID
#define LOG_ERROR_ASYNC   BOOST_LOG_TRIVIAL(error) << THREAD_ID << _TRACE_BACK_
#define LOG_DEBUG_ASYNC   BOOST_LOG_TRIVIAL(debug) << THREAD_ID

} // namespace libvvplay::log
