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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <libvvplay/tsfetcher/interface.hpp>
#include <unordered_map>

namespace libvvplay::fetch
{

// Plain and TLS GETs through Boost.Beast, one connection per request.
class VVPLAY_API HttpTransport final : public ISegmentTransport
{
public:
  explicit HttpTransport(boost::asio::io_context& ioc, bool verify_peer = true);

  void asyncGet(const Url& url, std::chrono::milliseconds timeout,
                TransferHandler handler) override;
  void cancelAll() override;

  [[nodiscard]] auto name() const -> std::string_view override { return "http"; }

private:
  boost::asio::io_context&                     m_ioc;
  boost::asio::ssl::context                    m_sslCtx;
  std::unordered_map<ui64, std::function<void()>> m_live; // request id -> canceller
  ui64                                         m_nextId = 0;
};

} // namespace libvvplay::fetch
