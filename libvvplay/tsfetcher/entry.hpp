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
#include <algorithm>
#include <deque>
#include <libvvplay/abrate/ThroughputEstimator.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <libvvplay/tsfetcher/interface.hpp>
#include <memory>
#include <unordered_set>

namespace libvvplay::fetch
{

// Capped exponential backoff: base, 2*base, 4*base, ... never above cap
struct RetryPolicy
{
  int                       max_attempts = 4;
  std::chrono::milliseconds backoff_base{200};
  std::chrono::milliseconds backoff_cap{4000};

  static auto fromConfig(const config::FetchConfig& cfg) -> RetryPolicy
  {
    return {cfg.max_attempts, cfg.backoff_base, cfg.backoff_cap};
  }

  // Delay before attempt `failed_attempts + 1`
  [[nodiscard]] auto backoff(int failed_attempts) const -> std::chrono::milliseconds
  {
    auto delay = backoff_base;
    for (int i = 1; i < failed_attempts && delay < backoff_cap; ++i)
      delay *= 2;
    return std::min(delay, backoff_cap);
  }
};

// A completed (or finally failed) segment fetch, ownership moves to the handler
struct FetchedSegment
{
  RepresentationID           representation;
  manifest::SegmentReference reference;
  SegmentBuffer              bytes;
  abr::ThroughputSample      sample; // of the successful attempt only
  int                        attempts = 0;
  std::string                last_error;
};

using SegmentHandler  = std::function<void(const boost::system::error_code&, FetchedSegment)>;
using ResourceHandler = std::function<void(const boost::system::error_code&, TransferResult)>;

/*
 * SEGMENT FETCH SCHEDULER
 *
 * Issues fetches in the order they were requested, keeps at most
 * `max_in_flight` of them on the wire (a request waiting out its backoff
 * still holds its slot) and retries transient failures with capped
 * exponential backoff. Completions may arrive out of order; re-ordering is
 * the decode pipeline's job.
 *
 * On exhaustion the handler receives fetch::error::segment_unavailable and a
 * FetchedSegment carrying the attempt count and the last error. What to do
 * next (downgrade, placeholders, stall) is the caller's decision.
 *
 * Not thread-safe: every call and every completion happens on the thread
 * running `ioc`. The scheduler must outlive the io_context's work.
 */
class VVPLAY_API SegmentFetchScheduler
{
public:
  SegmentFetchScheduler(boost::asio::io_context& ioc, ISegmentTransport& transport,
                        const config::FetchConfig& cfg);

  SegmentFetchScheduler(const SegmentFetchScheduler&)                    = delete;
  auto operator=(const SegmentFetchScheduler&) -> SegmentFetchScheduler& = delete;

  void fetch(const RepresentationID& rep_id, const manifest::SegmentReference& ref,
             SegmentHandler handler);

  // Any URL with the same retry policy, used for the manifest itself
  void fetchResource(const Url& url, ResourceHandler handler);

  // Fails everything queued or in flight with operation_aborted and refuses new work
  void cancelAll();

  [[nodiscard]] auto hasFreeSlot() const -> bool
  {
    return !m_cancelled && m_active + m_queue.size() < m_maxInFlight;
  }
  [[nodiscard]] auto inFlight() const -> std::size_t { return m_active; }
  [[nodiscard]] auto queued() const -> std::size_t { return m_queue.size(); }
  [[nodiscard]] auto idle() const -> bool { return m_active == 0 && m_queue.empty(); }
  [[nodiscard]] auto maxInFlight() const -> std::size_t { return m_maxInFlight; }
  [[nodiscard]] auto retryPolicy() const -> const RetryPolicy& { return m_retry; }

private:
  struct Request;
  using RequestPtr = std::shared_ptr<Request>;

  boost::asio::io_context&  m_ioc;
  ISegmentTransport&        m_transport;
  RetryPolicy               m_retry;
  std::chrono::milliseconds m_timeout;
  std::size_t               m_maxInFlight;
  std::size_t               m_active    = 0;
  bool                      m_cancelled = false;

  std::deque<RequestPtr>         m_queue;
  std::unordered_set<RequestPtr> m_running;

  void enqueue(RequestPtr request);
  void pump();
  void attempt(const RequestPtr& request);
  void onAttemptDone(const RequestPtr& request, const boost::system::error_code& ec,
                     TransferResult result);
  void complete(const RequestPtr& request, const boost::system::error_code& ec,
                TransferResult result);
};

} // namespace libvvplay::fetch
