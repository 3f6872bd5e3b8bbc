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

#include <string>
#include <string_view>

enum Macros
{
  VVPLAY_HTTP_VERSION          = 11,
  VVPLAY_DEFAULT_FPS           = 30,
  VVPLAY_MAX_SEGMENT_SIZE_MIBS = 512
};

#define VVPLAY_DEFAULT_HTTP_PORT_STR  "80"
#define VVPLAY_DEFAULT_HTTPS_PORT_STR "443"
/// Basic string for Carriage Return Line Feed (CRLF)
#define CRLF "\r\n"

#define VVPLAY_RET_SUC   0
#define VVPLAY_RET_FAIL  1
#define VVPLAY_RET_UNDEF -1

#define STRING_CONSTANTS(X)                                 \
  /* URL Schemes */                                         \
  X(SCHEME_HTTP, "http")                                    \
  X(SCHEME_HTTPS, "https")                                  \
  X(SCHEME_FILE, "file")                                    \
  X(SCHEME_SEP, "://")                                      \
                                                            \
  /* File Extensions */                                     \
  X(MANIFEST_EXT, ".mpd")                                   \
  X(SEGMENT_EXT, ".vvs")                                    \
  X(TOML_FILE_EXT, ".toml")                                 \
                                                            \
  /* Segment Container */                                   \
  X(SEGMENT_MAGIC, "VVSG")                                  \
                                                            \
  /* Client Identity */                                     \
  X(USER_AGENT, "VVPlayClient/1.0")                         \
  X(CONTENT_TYPE_OCTET_STREAM, "application/octet-stream")  \
  X(CONTENT_TYPE_DASH, "application/dash+xml")              \
                                                            \
  /* Directories */                                         \
  X(REL_PATH_CONFIG, ".config/vvplay/vvplay.toml")

namespace macros
{

#define DECLARE_STRING_VIEW(name, value) constexpr std::string_view name = value;
STRING_CONSTANTS(DECLARE_STRING_VIEW)
#undef DECLARE_STRING_VIEW

// Convert string_view to string using a function (avoiding constexpr std::string)
inline auto to_string(std::string_view sv) -> std::string { return std::string(sv); }

} // namespace macros
