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

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <libvvplay/common/error.hpp>

namespace libvvplay::fetch
{

namespace
{

class FetchErrorCategory : public boost::system::error_category
{
public:
  [[nodiscard]] auto name() const noexcept -> const char* override { return "vvplay.fetch"; }

  [[nodiscard]] auto message(int ev) const -> std::string override
  {
    switch (static_cast<error>(ev))
    {
      case error::http_client_error:
        return "server rejected the request (4xx)";
      case error::http_server_error:
        return "server failed the request (5xx)";
      case error::malformed_response:
        return "malformed HTTP response";
      case error::segment_unavailable:
        return "segment unavailable after retries";
    }
    return "unknown fetch error";
  }
};

} // namespace

auto error_category() -> const boost::system::error_category&
{
  static const FetchErrorCategory instance;
  return instance;
}

auto is_transient(const boost::system::error_code& ec) -> bool
{
  namespace aerr = boost::asio::error;

  if (!ec || ec == aerr::operation_aborted)
    return false;

  if (ec.category() == error_category())
    return ec == error::http_server_error || ec == error::malformed_response;

  return ec == aerr::timed_out || ec == boost::beast::error::timeout || ec == aerr::connection_reset ||
         ec == aerr::connection_refused || ec == aerr::connection_aborted ||
         ec == aerr::network_unreachable || ec == aerr::host_unreachable || ec == aerr::eof ||
         ec == aerr::broken_pipe || ec == aerr::host_not_found_try_again ||
         ec == boost::system::errc::timed_out;
}

} // namespace libvvplay::fetch
