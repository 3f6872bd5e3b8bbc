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

#include <libvvplay/common/api/entry.hpp>
#include <libvvplay/common/types.hpp>
#include <string>

namespace libvvplay::utils::web
{

struct ParsedUrl
{
  std::string scheme; // "http", "https", "file" or empty for a bare path
  IPAddr      host;
  PortNo      port;
  NetTarget   target; // path + query, always starts with '/' for network URLs

  [[nodiscard]] auto isNetwork() const -> bool { return !host.empty(); }
  [[nodiscard]] auto isSecure() const -> bool { return scheme == "https"; }
};

// Splits "scheme://host[:port]/target". URLs without a scheme are treated as
// local paths (target only). Throws std::invalid_argument on an empty host.
VVPLAY_API auto parseUrl(const Url& url) -> ParsedUrl;

// Everything up to and including the last '/' of the path component.
VVPLAY_API auto baseOf(const Url& url) -> Url;

// Resolves `ref` against `base` the way a browser resolves an href:
// absolute refs win, "/x" is host-relative, anything else is directory-relative.
VVPLAY_API auto resolveUrl(const Url& base, const Url& ref) -> Url;

// "file:///a/b" -> "/a/b", bare paths pass through.
VVPLAY_API auto localPathOf(const Url& url) -> AbsPath;

} // namespace libvvplay::utils::web
