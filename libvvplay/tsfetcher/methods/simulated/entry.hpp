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
#include <boost/asio/steady_timer.hpp>
#include <libvvplay/sim/network_trace.hpp>
#include <libvvplay/tsfetcher/interface.hpp>
#include <map>
#include <memory>
#include <optional>

namespace libvvplay::fetch
{

// Resolves a URL to the bytes the simulated server would send, nullopt is a 404
using PayloadSource = std::function<std::optional<SegmentBuffer>(const Url&)>;

/*
 * A bottleneck link replayed from a NetworkTrace in wall-clock time.
 *
 * Transfers share the link first come first served: a request starts moving
 * bytes when the previous one has finished (or timed out), and completes
 * when the trace has delivered all of its bytes. The trace's time zero is
 * the moment the transport is constructed.
 */
class VVPLAY_API SimulatedTransport final : public ISegmentTransport
{
public:
  SimulatedTransport(boost::asio::io_context& ioc, sim::NetworkTrace trace, PayloadSource source);

  void asyncGet(const Url& url, std::chrono::milliseconds timeout,
                TransferHandler handler) override;
  void cancelAll() override;

  [[nodiscard]] auto name() const -> std::string_view override { return "simulated"; }

  // In-memory payloads keyed by URL
  static auto fromMap(std::map<Url, SegmentBuffer> payloads) -> PayloadSource;
  // Payloads read from disk through LocalFileTransport::readFile
  static auto fromFiles() -> PayloadSource;

private:
  boost::asio::io_context&                            m_ioc;
  sim::NetworkTrace                                   m_trace;
  PayloadSource                                       m_source;
  TimePoint                                           m_epoch;
  MediaTime                                           m_linkFree{0};
  std::map<ui64, std::shared_ptr<boost::asio::steady_timer>> m_timers;
  ui64                                                m_nextId = 0;
};

} // namespace libvvplay::fetch
