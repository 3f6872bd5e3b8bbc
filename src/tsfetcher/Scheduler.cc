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
#include <boost/asio/post.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/tsfetcher/entry.hpp>

namespace asio = boost::asio;

namespace libvvplay::fetch
{

struct SegmentFetchScheduler::Request
{
  Url         url;
  std::string label; // "<rep>#<index>" for segments, the url otherwise
  int         attempts = 0;
  std::string last_error;
  bool        finished = false;

  std::unique_ptr<asio::steady_timer> backoff;

  std::function<void(const boost::system::error_code&, TransferResult, const Request&)> done;
};

SegmentFetchScheduler::SegmentFetchScheduler(asio::io_context& ioc, ISegmentTransport& transport,
                                             const config::FetchConfig& cfg)
    : m_ioc(ioc), m_transport(transport), m_retry(RetryPolicy::fromConfig(cfg)),
      m_timeout(cfg.timeout), m_maxInFlight(std::max<std::size_t>(cfg.max_in_flight, 1))
{
}

void SegmentFetchScheduler::fetch(const RepresentationID&           rep_id,
                                  const manifest::SegmentReference& ref, SegmentHandler handler)
{
  auto request   = std::make_shared<Request>();
  request->url   = ref.url;
  request->label = rep_id + "#" + std::to_string(ref.index);
  request->done  = [rep_id, ref, handler = std::move(handler)](
                    const boost::system::error_code& ec, TransferResult result, const Request& req)
  {
    FetchedSegment segment;
    segment.representation = rep_id;
    segment.reference      = ref;
    segment.attempts       = req.attempts;
    segment.last_error     = req.last_error;
    if (!ec)
    {
      segment.sample = {result.body.size(), result.elapsed};
      segment.bytes  = std::move(result.body);
    }
    handler(ec, std::move(segment));
  };

  log::TRACE<log::FETCH>("Queued {} ({})", request->label, request->url);
  enqueue(std::move(request));
}

void SegmentFetchScheduler::fetchResource(const Url& url, ResourceHandler handler)
{
  auto request   = std::make_shared<Request>();
  request->url   = url;
  request->label = url;
  request->done  = [handler = std::move(handler)](const boost::system::error_code& ec,
                                                 TransferResult result, const Request&)
  { handler(ec, std::move(result)); };

  enqueue(std::move(request));
}

void SegmentFetchScheduler::enqueue(RequestPtr request)
{
  if (m_cancelled)
  {
    asio::post(m_ioc,
               [request]()
               {
                 request->finished = true;
                 request->done(asio::error::operation_aborted, {}, *request);
               });
    return;
  }

  m_queue.push_back(std::move(request));
  pump();
}

void SegmentFetchScheduler::pump()
{
  while (!m_cancelled && m_active < m_maxInFlight && !m_queue.empty())
  {
    auto request = std::move(m_queue.front());
    m_queue.pop_front();

    ++m_active;
    m_running.insert(request);
    attempt(request);
  }
}

void SegmentFetchScheduler::attempt(const RequestPtr& request)
{
  ++request->attempts;
  log::DBG<log::FETCH>("GET {} attempt {}/{} ({} in flight)", request->label, request->attempts,
                       m_retry.max_attempts, m_active);

  m_transport.asyncGet(request->url, m_timeout,
                       [this, request](const boost::system::error_code& ec, TransferResult result)
                       { onAttemptDone(request, ec, std::move(result)); });
}

void SegmentFetchScheduler::onAttemptDone(const RequestPtr&                request,
                                          const boost::system::error_code& ec,
                                          TransferResult                   result)
{
  if (request->finished)
    return;

  if (m_cancelled || ec == asio::error::operation_aborted)
    return complete(request, asio::error::operation_aborted, {});

  if (!ec)
    return complete(request, {}, std::move(result));

  request->last_error = ec.message();

  if (!is_transient(ec))
  {
    log::ERROR<log::FETCH>("{} failed permanently: {}", request->label, request->last_error);
    return complete(request, make_error_code(error::segment_unavailable), {});
  }

  if (request->attempts >= m_retry.max_attempts)
  {
    log::ERROR<log::FETCH>("{} failed after {} attempt(s): {}", request->label, request->attempts,
                           request->last_error);
    return complete(request, make_error_code(error::segment_unavailable), {});
  }

  const auto delay = m_retry.backoff(request->attempts);
  log::WARN<log::FETCH>("{} attempt {} failed ({}), retrying in {} ms", request->label,
                        request->attempts, request->last_error, delay.count());

  request->backoff = std::make_unique<asio::steady_timer>(m_ioc, delay);
  request->backoff->async_wait(
    [this, request](const boost::system::error_code& timer_ec)
    {
      if (request->finished)
        return;
      if (timer_ec || m_cancelled)
        return complete(request, asio::error::operation_aborted, {});
      attempt(request);
    });
}

void SegmentFetchScheduler::complete(const RequestPtr&                request,
                                     const boost::system::error_code& ec, TransferResult result)
{
  request->finished = true;
  request->backoff.reset();
  if (m_running.erase(request) > 0)
    --m_active;

  if (!ec)
    log::TRACE<log::FETCH>("{} done: {} bytes after {} attempt(s)", request->label,
                           result.body.size(), request->attempts);

  request->done(ec, std::move(result), *request);
  pump();
}

void SegmentFetchScheduler::cancelAll()
{
  if (m_cancelled)
    return;
  m_cancelled = true;

  log::INFO<log::FETCH>("Cancelling {} queued and {} in-flight fetch(es)", m_queue.size(),
                        m_active);

  auto queued = std::move(m_queue);
  m_queue.clear();
  for (auto& request : queued)
  {
    asio::post(m_ioc,
               [request]()
               {
                 request->finished = true;
                 request->done(asio::error::operation_aborted, {}, *request);
               });
  }

  for (const auto& request : m_running)
  {
    if (request->backoff)
      request->backoff->cancel();
  }

  m_transport.cancelAll();
}

} // namespace libvvplay::fetch
