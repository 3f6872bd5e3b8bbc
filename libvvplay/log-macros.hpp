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

#include <libvvplay/logger.hpp>

#include <fmt/format.h>
#include <string_view>
#include <type_traits>

#define INIT_VVPLAY_LOGGER()                                                                 \
  libvvplay::log::init_logging();                                                           \
  LOG_INFO << "VVPlay logger initialized! Check VVPLAY_LOG_LEVEL (environment variable) for " \
              "which log level this session is on!!";

/* ------------ LOG CATEGORIES --------------- */

#define LOG_FMT(str) BOLD str RESET

#define LOG_CATEGORIES                    \
  X(MANIFEST, "#MANIFEST_LOG    ")        \
  X(ABR, "#ABR_LOG         ")             \
  X(FETCH, "#FETCH_LOG       ")           \
  X(NET, "#NETWORK_LOG     ")             \
  X(DECODER, "#DECODER_LOG     ")         \
  X(PLAYBACK, "#PLAYBACK_LOG    ")        \
  X(SESSION, "#SESSION_LOG     ")         \
  X(CONFIG, "#CONFIG_LOG      ")          \
  X(SIM, "#SIM_LOG         ")             \
  X(CLIENT, "#CLIENT_LOG      ")

namespace libvvplay::log
{

// One empty tag type per category, the prefix is picked at compile time
#define X(name, str) \
  struct name        \
  {                  \
  };
LOG_CATEGORIES
#undef X

struct NONE
{
};

template <typename Tag> constexpr auto log_prefix() -> const char*
{
#define X(name, str)                    \
  if constexpr (std::is_same_v<Tag, name>) \
    return LOG_FMT(str);
  LOG_CATEGORIES
#undef X
  return "";
}

} // namespace libvvplay::log

#undef LOG_FMT

/* ------------ LOGGING MACROS --------------- */

enum class LogMode
{
  Sync,
  Async
};

template <typename T, typename = void> struct is_formattable : std::false_type
{
};

template <typename T>
struct is_formattable<T, std::void_t<decltype(fmt::formatter<std::remove_cvref_t<T>, char>{})>>
    : std::true_type
{
};

template <typename... Args> constexpr bool all_formattable_v = (is_formattable<Args>::value && ...);

#define LOG_ARGS_TYPE_CHECK()                                                              \
  static_assert(                                                                           \
    all_formattable_v<Args...>,                                                            \
    "One or more arguments passed to LOG MACROS are not formattable with fmt. Consider " \
    "converting types like std::filesystem::path to string using .string().");

namespace libvvplay::log
{

// ---- INFO ----
template <typename Tag, typename... Args>
inline void INFO(LogMode mode, std::string_view fmt_str, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto formatted = fmt::vformat(fmt_str, fmt::make_format_args(args...));
  if (mode == LogMode::Async)
    LOG_INFO_ASYNC << log_prefix<Tag>() << formatted;
  else
    LOG_INFO << log_prefix<Tag>() << formatted;
}

// ---- ERROR ----
template <typename Tag, typename... Args>
inline void ERROR(LogMode mode, std::string_view fmt_str, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto formatted = fmt::vformat(fmt_str, fmt::make_format_args(args...));
  if (mode == LogMode::Async)
    LOG_ERROR_ASYNC << log_prefix<Tag>() << formatted;
  else
    LOG_ERROR << log_prefix<Tag>() << formatted;
}

// ---- DEBUG ----
template <typename Tag, typename... Args>
inline void DBG(LogMode mode, std::string_view fmt_str, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto formatted = fmt::vformat(fmt_str, fmt::make_format_args(args...));
  if (mode == LogMode::Async)
    LOG_DEBUG_ASYNC << log_prefix<Tag>() << formatted;
  else
    LOG_DEBUG << log_prefix<Tag>() << formatted;
}

// ---- TRACE ----
template <typename Tag, typename... Args>
inline void TRACE(LogMode mode, std::string_view fmt_str, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto formatted = fmt::vformat(fmt_str, fmt::make_format_args(args...));
  if (mode == LogMode::Async)
    LOG_TRACE_ASYNC << log_prefix<Tag>() << formatted;
  else
    LOG_TRACE << log_prefix<Tag>() << formatted;
}

// ---- WARN ----
template <typename Tag, typename... Args>
inline void WARN(LogMode mode, std::string_view fmt_str, Args&&... args)
{
  LOG_ARGS_TYPE_CHECK();

  auto formatted = fmt::vformat(fmt_str, fmt::make_format_args(args...));
  if (mode == LogMode::Async)
    LOG_WARNING_ASYNC << log_prefix<Tag>() << formatted;
  else
    LOG_WARNING << log_prefix<Tag>() << formatted;
}

// ---- Default Sync Overloads ----

template <typename Tag, typename... Args> inline void INFO(std::string_view fmt_str, Args&&... args)
{
  INFO<Tag>(LogMode::Sync, fmt_str, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void ERROR(std::string_view fmt_str, Args&&... args)
{
  ERROR<Tag>(LogMode::Sync, fmt_str, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void DBG(std::string_view fmt_str, Args&&... args)
{
  DBG<Tag>(LogMode::Sync, fmt_str, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void TRACE(std::string_view fmt_str, Args&&... args)
{
  TRACE<Tag>(LogMode::Sync, fmt_str, std::forward<Args>(args)...);
}

template <typename Tag, typename... Args> inline void WARN(std::string_view fmt_str, Args&&... args)
{
  WARN<Tag>(LogMode::Sync, fmt_str, std::forward<Args>(args)...);
}

} // namespace libvvplay::log
