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
#include <libvvplay/tsfetcher/interface.hpp>

namespace libvvplay::fetch
{

/*
 * Serves `file://` URLs and bare paths straight off disk. Reads complete on
 * the io_context thread and cost no network time, which is what makes local
 * playback a degenerate Representation for the ABR engine.
 */
class VVPLAY_API LocalFileTransport final : public ISegmentTransport
{
public:
  explicit LocalFileTransport(boost::asio::io_context& ioc) : m_ioc(ioc) {}

  void asyncGet(const Url& url, std::chrono::milliseconds timeout,
                TransferHandler handler) override;
  void cancelAll() override { ++m_generation; }

  [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

  // Reads a whole file, throws libvvplay::FetchError when it cannot
  static auto readFile(const AbsPath& path) -> SegmentBuffer;

private:
  boost::asio::io_context& m_ioc;
  ui64                     m_generation = 0;
};

} // namespace libvvplay::fetch
