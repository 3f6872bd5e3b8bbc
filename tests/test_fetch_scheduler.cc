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
#include <boost/asio/post.hpp>
#include <deque>
#include <gtest/gtest.h>
#include <libvvplay/tsfetcher/entry.hpp>
#include <map>

using namespace libvvplay;
using namespace libvvplay::fetch;
using namespace std::chrono_literals;

namespace asio = boost::asio;

namespace
{

/*
 * Transport double. In held mode requests wait until the test completes
 * them; in auto mode every request is answered on the next io_context turn
 * with the next scripted outcome for its URL (success once the script runs dry).
 */
class ScriptedTransport final : public ISegmentTransport
{
public:
  explicit ScriptedTransport(asio::io_context& ioc, bool hold = false) : m_ioc(ioc), m_hold(hold)
  {
  }

  void asyncGet(const Url& url, std::chrono::milliseconds, TransferHandler handler) override
  {
    requests.push_back(url);
    peak = std::max(peak, ++inFlight);

    if (m_hold)
    {
      pending.push_back({url, std::move(handler)});
      return;
    }

    boost::system::error_code ec;
    if (auto it = script.find(url); it != script.end() && !it->second.empty())
    {
      ec = it->second.front();
      it->second.pop_front();
    }

    asio::post(m_ioc,
               [this, url, ec, handler = std::move(handler)]()
               {
                 --inFlight;
                 handler(ec, ec ? TransferResult{} : bodyFor(url));
               });
  }

  void cancelAll() override
  {
    auto held = std::move(pending);
    pending.clear();
    for (auto& req : held)
    {
      asio::post(m_ioc,
                 [this, handler = std::move(req.handler)]()
                 {
                   --inFlight;
                   handler(asio::error::operation_aborted, {});
                 });
    }
  }

  [[nodiscard]] auto name() const -> std::string_view override { return "scripted"; }

  // Held mode: answers the oldest request successfully
  void completeOldest()
  {
    ASSERT_FALSE(pending.empty());
    auto req = std::move(pending.front());
    pending.pop_front();
    --inFlight;
    req.handler({}, bodyFor(req.url));
  }

  static auto bodyFor(const Url& url) -> TransferResult
  {
    TransferResult result;
    result.body.assign(url.begin(), url.end());
    result.elapsed = 10ms;
    result.status  = 200;
    return result;
  }

  struct Held
  {
    Url             url;
    TransferHandler handler;
  };

  std::map<Url, std::deque<boost::system::error_code>> script;
  std::vector<Url>                                     requests;
  std::deque<Held>                                     pending;
  std::size_t                                          inFlight = 0;
  std::size_t                                          peak     = 0;

private:
  asio::io_context& m_ioc;
  bool              m_hold;
};

auto segment(SegmentIndex i) -> manifest::SegmentReference
{
  return manifest::SegmentReference{.index = i, .url = "http://h/seg_" + std::to_string(i)};
}

auto fastRetries(int attempts) -> config::FetchConfig
{
  config::FetchConfig cfg;
  cfg.max_in_flight = 2;
  cfg.max_attempts  = attempts;
  cfg.backoff_base  = 1ms;
  cfg.backoff_cap   = 4ms;
  return cfg;
}

struct Outcome
{
  boost::system::error_code ec;
  FetchedSegment            segment;
};

} // namespace

TEST(RetryPolicyTest, BackoffDoublesUpToCap)
{
  RetryPolicy policy{4, 200ms, 1000ms};

  EXPECT_EQ(policy.backoff(1), 200ms);
  EXPECT_EQ(policy.backoff(2), 400ms);
  EXPECT_EQ(policy.backoff(3), 800ms);
  EXPECT_EQ(policy.backoff(4), 1000ms);
  EXPECT_EQ(policy.backoff(30), 1000ms);
}

TEST(SegmentFetchSchedulerTest, KeepsAtMostMaxInFlightInIssueOrder)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc, /*hold=*/true);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(4));

  std::vector<SegmentIndex> completed;
  for (SegmentIndex i = 0; i < 5; ++i)
  {
    scheduler.fetch("q1", segment(i),
                    [&](const boost::system::error_code& ec, FetchedSegment seg)
                    {
                      EXPECT_FALSE(ec);
                      completed.push_back(seg.reference.index);
                    });
  }

  EXPECT_EQ(scheduler.inFlight(), 2u);
  EXPECT_EQ(scheduler.queued(), 3u);
  EXPECT_FALSE(scheduler.hasFreeSlot());

  while (!transport.pending.empty())
    transport.completeOldest();

  EXPECT_EQ(transport.peak, 2u);
  EXPECT_EQ(completed, (std::vector<SegmentIndex>{0, 1, 2, 3, 4}));
  ASSERT_EQ(transport.requests.size(), 5u);
  for (SegmentIndex i = 0; i < 5; ++i)
    EXPECT_EQ(transport.requests[i], segment(i).url);
  EXPECT_TRUE(scheduler.idle());
  EXPECT_TRUE(scheduler.hasFreeSlot());
}

TEST(SegmentFetchSchedulerTest, TransientFailuresAreRetried)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(4));

  const auto ref            = segment(7);
  transport.script[ref.url] = {make_error_code(error::http_server_error), asio::error::timed_out};

  std::optional<Outcome> outcome;
  scheduler.fetch("q4", ref,
                  [&](const boost::system::error_code& ec, FetchedSegment seg)
                  { outcome = Outcome{ec, std::move(seg)}; });
  ioc.run();

  ASSERT_TRUE(outcome);
  EXPECT_FALSE(outcome->ec);
  EXPECT_EQ(outcome->segment.attempts, 3);
  EXPECT_EQ(outcome->segment.representation, "q4");
  EXPECT_EQ(outcome->segment.bytes.size(), ref.url.size());
  EXPECT_EQ(outcome->segment.sample.bytes, ref.url.size());
  EXPECT_EQ(transport.requests.size(), 3u);
}

TEST(SegmentFetchSchedulerTest, ExhaustedRetriesReportSegmentUnavailable)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(3));

  const auto ref            = segment(0);
  transport.script[ref.url] = {asio::error::timed_out, asio::error::timed_out,
                               asio::error::timed_out, asio::error::timed_out};

  std::optional<Outcome> outcome;
  scheduler.fetch("q1", ref,
                  [&](const boost::system::error_code& ec, FetchedSegment seg)
                  { outcome = Outcome{ec, std::move(seg)}; });
  ioc.run();

  ASSERT_TRUE(outcome);
  EXPECT_EQ(outcome->ec, make_error_code(error::segment_unavailable));
  EXPECT_EQ(outcome->segment.attempts, 3);
  EXPECT_FALSE(outcome->segment.last_error.empty());
  EXPECT_TRUE(outcome->segment.bytes.empty());
  EXPECT_EQ(transport.requests.size(), 3u);
}

TEST(SegmentFetchSchedulerTest, ClientErrorsAreNotRetried)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(4));

  const auto ref            = segment(3);
  transport.script[ref.url] = {make_error_code(error::http_client_error)};

  std::optional<Outcome> outcome;
  scheduler.fetch("q1", ref,
                  [&](const boost::system::error_code& ec, FetchedSegment seg)
                  { outcome = Outcome{ec, std::move(seg)}; });
  ioc.run();

  ASSERT_TRUE(outcome);
  EXPECT_EQ(outcome->ec, make_error_code(error::segment_unavailable));
  EXPECT_EQ(outcome->segment.attempts, 1);
  EXPECT_EQ(transport.requests.size(), 1u);
}

TEST(SegmentFetchSchedulerTest, CancelAllAbortsQueuedAndRunningWork)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc, /*hold=*/true);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(4));

  int aborted = 0;
  auto count  = [&](const boost::system::error_code& ec, FetchedSegment)
  {
    if (ec == asio::error::operation_aborted)
      ++aborted;
  };

  for (SegmentIndex i = 0; i < 4; ++i)
    scheduler.fetch("q1", segment(i), count);

  scheduler.cancelAll();
  scheduler.fetch("q1", segment(9), count);
  EXPECT_FALSE(scheduler.hasFreeSlot());

  ioc.run();

  EXPECT_EQ(aborted, 5);
  EXPECT_EQ(transport.requests.size(), 2u);
  EXPECT_TRUE(scheduler.idle());
}

TEST(SegmentFetchSchedulerTest, ResourceFetchDeliversRawBody)
{
  asio::io_context      ioc;
  ScriptedTransport     transport(ioc);
  SegmentFetchScheduler scheduler(ioc, transport, fastRetries(2));

  std::optional<TransferResult> got;
  scheduler.fetchResource("http://h/stream.mpd",
                          [&](const boost::system::error_code& ec, TransferResult result)
                          {
                            EXPECT_FALSE(ec);
                            got = std::move(result);
                          });
  ioc.run();

  ASSERT_TRUE(got);
  EXPECT_EQ(std::string(got->body.begin(), got->body.end()), "http://h/stream.mpd");
}
