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

#include <boost/asio/post.hpp>
#include <libvvplay/common/error.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/tsfetcher/methods/local/entry.hpp>
#include <libvvplay/tsfetcher/methods/simulated/entry.hpp>
#include <libvvplay/utils/web/parser.hpp>
#include <stdexcept>

namespace asio = boost::asio;

namespace libvvplay::fetch
{

SimulatedTransport::SimulatedTransport(asio::io_context& ioc, sim::NetworkTrace trace,
                                       PayloadSource source)
    : m_ioc(ioc), m_trace(std::move(trace)), m_source(std::move(source)),
      m_epoch(SteadyClock::now())
{
}

void SimulatedTransport::asyncGet(const Url& url, std::chrono::milliseconds timeout,
                                  TransferHandler handler)
{
  const auto issued = SteadyClock::now();
  const auto now    = std::chrono::duration_cast<MediaTime>(issued - m_epoch);

  auto payload = m_source(url);
  if (!payload)
  {
    log::WARN<log::SIM>("No payload for '{}', answering 404", url);
    asio::post(m_ioc,
               [handler = std::move(handler)]()
               {
                 TransferResult result;
                 result.status = 404;
                 handler(make_error_code(error::http_client_error), std::move(result));
               });
    return;
  }

  const MediaTime start    = std::max(now, m_linkFree);
  const MediaTime deadline = now + std::chrono::duration_cast<MediaTime>(timeout);
  const auto      finish   = m_trace.transferFinish(start, payload->size());
  const bool      on_time  = finish && *finish <= deadline;
  const MediaTime fire_at  = on_time ? *finish : deadline;

  // A timed out transfer stops occupying the link at its deadline
  if (fire_at > start)
    m_linkFree = fire_at;

  log::TRACE<log::SIM>("{} ({} bytes): link at {} ms, done at {} ms{}", url, payload->size(),
                       std::chrono::duration_cast<Millis>(start).count(),
                       std::chrono::duration_cast<Millis>(fire_at).count(),
                       on_time ? "" : " (timeout)");

  const auto id    = m_nextId++;
  auto       timer = std::make_shared<asio::steady_timer>(m_ioc, m_epoch + fire_at);
  m_timers[id]     = timer;

  timer->async_wait(
    [this, id, timer, on_time, issued, payload = std::move(payload),
     handler = std::move(handler)](const boost::system::error_code& ec) mutable
    {
      m_timers.erase(id);
      if (ec)
        return handler(asio::error::operation_aborted, {});
      if (!on_time)
        return handler(asio::error::timed_out, {});

      TransferResult result;
      result.status  = 200;
      result.elapsed = SteadyClock::now() - issued;
      result.body    = std::move(*payload);
      handler({}, std::move(result));
    });
}

void SimulatedTransport::cancelAll()
{
  auto timers = std::move(m_timers);
  m_timers.clear();
  for (auto& [id, timer] : timers)
    timer->cancel();
}

auto SimulatedTransport::fromMap(std::map<Url, SegmentBuffer> payloads) -> PayloadSource
{
  auto shared = std::make_shared<const std::map<Url, SegmentBuffer>>(std::move(payloads));
  return [shared](const Url& url) -> std::optional<SegmentBuffer>
  {
    auto it = shared->find(url);
    if (it == shared->end())
      return std::nullopt;
    return it->second;
  };
}

auto SimulatedTransport::fromFiles() -> PayloadSource
{
  return [](const Url& url) -> std::optional<SegmentBuffer>
  {
    try
    {
      return LocalFileTransport::readFile(utils::web::localPathOf(url));
    }
    catch (const FetchError& e)
    {
      log::DBG<log::SIM>("{}", e.what());
      return std::nullopt;
    }
    catch (const std::invalid_argument& e)
    {
      // a network URL has no file behind it
      log::DBG<log::SIM>("'{}' is not a local path: {}", url, e.what());
      return std::nullopt;
    }
  };
}

} // namespace libvvplay::fetch
