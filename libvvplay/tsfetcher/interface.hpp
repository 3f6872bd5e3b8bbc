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

#include <boost/system/error_code.hpp>
#include <chrono>
#include <functional>
#include <libvvplay/common/types.hpp>
#include <memory>
#include <string_view>

namespace libvvplay::fetch
{

struct TransferResult
{
  SegmentBuffer            body;
  std::chrono::nanoseconds elapsed{}; // request issue to last byte
  unsigned                 status = 0; // HTTP status where the transport has one
};

using TransferHandler = std::function<void(const boost::system::error_code&, TransferResult)>;

/*
 * One way of moving segment bytes: HTTP(S), local disk or a simulated link.
 *
 * asyncGet must not block the caller and must invoke the handler exactly
 * once, from the thread running the transport's io_context. Expiry of
 * `timeout` is reported as asio::error::timed_out (or beast's timeout),
 * cancellation as asio::error::operation_aborted, HTTP statuses through the
 * libvvplay::fetch error category.
 */
class ISegmentTransport
{
public:
  virtual ~ISegmentTransport() = default;

  virtual void asyncGet(const Url& url, std::chrono::milliseconds timeout,
                        TransferHandler handler) = 0;

  // Abandons every transfer in flight
  virtual void cancelAll() = 0;

  [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

using SegmentTransportPtr = std::unique_ptr<ISegmentTransport>;

} // namespace libvvplay::fetch
