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

#include <libvvplay/common/macros.hpp>
#include <libvvplay/utils/web/parser.hpp>
#include <stdexcept>

namespace libvvplay::utils::web
{

namespace
{

auto hasScheme(const Url& url) -> bool
{
  auto pos = url.find(macros::SCHEME_SEP);
  if (pos == std::string::npos || pos == 0)
    return false;
  // a scheme never contains '/', otherwise "a/b://c" would qualify
  return url.find('/') > pos;
}

} // namespace

auto parseUrl(const Url& url) -> ParsedUrl
{
  ParsedUrl parsed;

  if (!hasScheme(url))
  {
    parsed.target = url;
    return parsed;
  }

  size_t scheme_end = url.find(macros::SCHEME_SEP);
  parsed.scheme     = url.substr(0, scheme_end);
  size_t start      = scheme_end + macros::SCHEME_SEP.size();

  if (parsed.scheme == macros::SCHEME_FILE)
  {
    parsed.target = url.substr(start);
    return parsed;
  }

  size_t      end       = url.find('/', start);
  std::string full_host = url.substr(start, end == std::string::npos ? end : end - start);
  size_t      port_pos  = full_host.rfind(':');

  if (port_pos != std::string::npos && full_host.find(']') == std::string::npos)
  {
    parsed.host = full_host.substr(0, port_pos);
    parsed.port = full_host.substr(port_pos + 1);
  }
  else
  {
    parsed.host = full_host;
    parsed.port = parsed.scheme == macros::SCHEME_HTTPS ? VVPLAY_DEFAULT_HTTPS_PORT_STR
                                                        : VVPLAY_DEFAULT_HTTP_PORT_STR;
  }

  if (parsed.host.empty())
    throw std::invalid_argument("URL has no host: " + url);

  parsed.target = (end == std::string::npos) ? "/" : url.substr(end);
  return parsed;
}

auto baseOf(const Url& url) -> Url
{
  size_t path_start = 0;
  if (hasScheme(url))
  {
    size_t after_scheme = url.find(macros::SCHEME_SEP) + macros::SCHEME_SEP.size();
    size_t slash        = url.find('/', after_scheme);
    if (slash == std::string::npos)
      return url + "/";
    path_start = slash;
  }

  // drop query before looking for the directory
  size_t query = url.find('?', path_start);
  Url    path  = url.substr(0, query);

  size_t last_slash = path.rfind('/');
  if (last_slash == std::string::npos || last_slash < path_start)
    return "";
  return path.substr(0, last_slash + 1);
}

auto resolveUrl(const Url& base, const Url& ref) -> Url
{
  if (ref.empty())
    return base;
  if (hasScheme(ref) || base.empty())
    return ref;

  if (ref.front() == '/')
  {
    if (!hasScheme(base))
      return ref;

    ParsedUrl b = parseUrl(base);
    if (!b.isNetwork())
      return b.scheme + macros::to_string(macros::SCHEME_SEP) + ref;
    return b.scheme + macros::to_string(macros::SCHEME_SEP) + b.host + ":" + b.port + ref;
  }

  Url dir = base.back() == '/' ? base : baseOf(base);
  return dir + ref;
}

auto localPathOf(const Url& url) -> AbsPath
{
  ParsedUrl parsed = parseUrl(url);
  if (parsed.isNetwork())
    throw std::invalid_argument("Not a local URL: " + url);
  return parsed.target;
}

} // namespace libvvplay::utils::web
