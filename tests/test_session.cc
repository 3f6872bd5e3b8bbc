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

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <libvvplay/codec/entry.hpp>
#include <libvvplay/components/client/session.hpp>
#include <libvvplay/tsfetcher/methods/local/entry.hpp>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

using namespace libvvplay;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace
{

class RecordingSink final : public playback::IFrameSink
{
public:
  void present(const decoder::DecodedFrame& frame) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    seqs.push_back(frame.seq);
    if (frame.missing)
      ++missing;
  }

  void onEndOfStream() override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++ends;
  }

  std::vector<FrameSeq> seqs;
  int                   missing = 0;
  int                   ends    = 0;

private:
  std::mutex m_mutex;
};

/*
 * Answers every GET after a fixed delay: URLs under /high/ are 404, all
 * others get `body`. Requests are logged in issue order.
 */
class ScriptedTransport final : public fetch::ISegmentTransport
{
public:
  ScriptedTransport(boost::asio::io_context& ioc, SegmentBuffer body,
                    std::shared_ptr<std::vector<Url>> requests)
      : m_ioc(ioc), m_body(std::move(body)), m_requests(std::move(requests))
  {
  }

  void asyncGet(const Url& url, std::chrono::milliseconds, fetch::TransferHandler handler) override
  {
    m_requests->push_back(url);

    auto timer = std::make_shared<boost::asio::steady_timer>(m_ioc, DELAY);
    m_timers.insert(timer);
    timer->async_wait(
      [this, timer, url, handler = std::move(handler)](const boost::system::error_code& ec)
      {
        m_timers.erase(timer);
        fetch::TransferResult result;
        if (ec)
          return handler(boost::asio::error::operation_aborted, std::move(result));

        if (url.find("/high/") != std::string::npos)
        {
          result.status = 404;
          return handler(fetch::make_error_code(fetch::error::http_client_error), std::move(result));
        }

        result.status  = 200;
        result.elapsed = DELAY;
        result.body    = m_body;
        handler({}, std::move(result));
      });
  }

  void cancelAll() override
  {
    auto timers = std::move(m_timers);
    m_timers.clear();
    for (const auto& t : timers)
      t->cancel();
  }

  [[nodiscard]] auto name() const -> std::string_view override { return "scripted"; }

  static constexpr std::chrono::milliseconds DELAY{40};

private:
  boost::asio::io_context&                             m_ioc;
  SegmentBuffer                                        m_body;
  std::shared_ptr<std::vector<Url>>                    m_requests;
  std::set<std::shared_ptr<boost::asio::steady_timer>> m_timers;
};

// One directory of .vvs files per test, removed afterwards
class StreamSessionTest : public ::testing::Test
{
protected:
  static constexpr double     FPS                = 50.0;
  static constexpr FrameCount FRAMES_PER_SEGMENT = 5;

  void SetUp() override
  {
    dir = fs::temp_directory_path() /
          ("vvplay_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override { fs::remove_all(dir); }

  auto writeSegment(int n, const SegmentBuffer& bytes) -> AbsPath
  {
    char name[32];
    std::snprintf(name, sizeof(name), "seg_%04d.vvs", n);
    const auto    path = (dir / name).string();
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path;
  }

  auto goodSegment() -> SegmentBuffer
  {
    std::vector<decoder::PointCloud> frames(FRAMES_PER_SEGMENT);
    for (auto& cloud : frames)
      cloud.push_back({1.0F, 2.0F, 3.0F, 10, 20, 30});
    return codec::encodeSegment(frames);
  }

  static auto localConfig() -> config::PlayerConfig
  {
    config::PlayerConfig cfg;
    cfg.abr.low_water         = 100ms;
    cfg.abr.high_water        = 300ms;
    cfg.abr.buffer_target     = 500ms;
    cfg.fetch.timeout         = 1000ms;
    cfg.fetch.backoff_base    = 1ms;
    cfg.fetch.backoff_cap     = 2ms;
    cfg.playback.control_poll = 5ms;
    return cfg;
  }

  static auto localTransport() -> components::client::TransportFactory
  {
    return [](boost::asio::io_context& ioc) -> fetch::SegmentTransportPtr
    { return std::make_unique<fetch::LocalFileTransport>(ioc); };
  }

  fs::path dir;
};

} // namespace

TEST_F(StreamSessionTest, PlaysLocalSegmentsToTheEnd)
{
  std::vector<AbsPath> files;
  for (int i = 0; i < 4; ++i)
    files.push_back(writeSegment(i, goodSegment()));
  const auto manifest = manifest::Manifest::fromLocalFiles(files, FPS, FRAMES_PER_SEGMENT);

  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(localConfig(), localTransport(), decoder, sink);

  session.play(manifest);

  const auto& metrics = session.metrics();
  EXPECT_EQ(sink.ends, 1);
  EXPECT_EQ(metrics.segments_downloaded.load(), 4u);
  EXPECT_EQ(metrics.frames_presented.load() + metrics.frames_dropped.load(), 20u);
  EXPECT_EQ(metrics.segments_unavailable.load(), 0u);
  EXPECT_EQ(sink.missing, 0);
  EXPECT_TRUE(std::is_sorted(sink.seqs.begin(), sink.seqs.end()));
  EXPECT_EQ(std::adjacent_find(sink.seqs.begin(), sink.seqs.end()), sink.seqs.end());
  ASSERT_FALSE(sink.seqs.empty());
  EXPECT_EQ(sink.seqs.back(), 19u);
}

TEST_F(StreamSessionTest, UnreadableAndCorruptSegmentsBecomePlaceholders)
{
  std::vector<AbsPath> files;
  files.push_back(writeSegment(0, goodSegment()));
  files.push_back(writeSegment(1, SegmentBuffer{'j', 'u', 'n', 'k'}));
  files.push_back((dir / "seg_0002.vvs").string()); // never written
  files.push_back(writeSegment(3, goodSegment()));
  const auto manifest = manifest::Manifest::fromLocalFiles(files, FPS, FRAMES_PER_SEGMENT);

  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(localConfig(), localTransport(), decoder, sink);

  session.play(manifest);

  const auto& metrics = session.metrics();
  EXPECT_EQ(sink.ends, 1);
  EXPECT_EQ(metrics.segments_unavailable.load(), 1u);
  EXPECT_EQ(metrics.decode_failures.load(), 1u);
  EXPECT_EQ(metrics.frames_presented.load() + metrics.frames_dropped.load(), 20u);
  EXPECT_EQ(metrics.frames_missing.load(), static_cast<ui64>(sink.missing));
}

TEST_F(StreamSessionTest, StopEndsPlaybackEarly)
{
  std::vector<AbsPath> files;
  for (int i = 0; i < 40; ++i)
    files.push_back(writeSegment(i, goodSegment()));
  // 40 segments of one second each
  const auto manifest = manifest::Manifest::fromLocalFiles(files, 5.0, FRAMES_PER_SEGMENT);

  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(localConfig(), localTransport(), decoder, sink);

  std::thread stopper(
    [&session]
    {
      std::this_thread::sleep_for(300ms);
      session.stop();
    });

  const auto started = std::chrono::steady_clock::now();
  session.play(manifest);
  stopper.join();

  EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
  EXPECT_LT(session.metrics().frames_presented.load(), 200u);
  EXPECT_EQ(sink.ends, 0);
}

TEST_F(StreamSessionTest, LoadsManifestThroughTheTransport)
{
  const auto path = (dir / "stream.mpd").string();
  {
    std::ofstream out(path);
    out << R"(<MPD mediaPresentationDuration="PT2S"><Period><AdaptationSet frameRate="30">
<SegmentTemplate media="$RepresentationID$_$Number$.vvs" duration="1"/>
<Representation id="lo" bandwidth="1000000"/><Representation id="hi" bandwidth="3000000"/>
</AdaptationSet></Period></MPD>)";
  }

  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(localConfig(), localTransport(), decoder, sink);

  const auto manifest = session.loadManifest("file://" + path);
  EXPECT_EQ(manifest.segmentCount(), 2u);
  EXPECT_EQ(manifest.segmentReference("hi", 0).url, "file://" + (dir / "hi_1.vvs").string());
}

TEST_F(StreamSessionTest, MissingManifestIsAFetchError)
{
  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(localConfig(), localTransport(), decoder, sink);

  EXPECT_THROW(session.loadManifest((dir / "absent.mpd").string()), FetchError);
}

TEST_F(StreamSessionTest, FailedUpperTierIsRefetchedAtTheLowestTier)
{
  // six half-second segments of 5 frames, two tiers far below the link rate
  const auto manifest = manifest::Manifest::parse(R"(<MPD mediaPresentationDuration="PT3S">
  <Period>
    <AdaptationSet frameRate="10">
      <SegmentTemplate media="$RepresentationID$/seg_$Number$.vvs" timescale="2" duration="1"/>
      <Representation id="low" bandwidth="1000"/>
      <Representation id="high" bandwidth="2000"/>
    </AdaptationSet>
  </Period>
</MPD>)",
                                                  "http://scripted.test/stream.mpd");
  ASSERT_EQ(manifest.segmentCount(), 6u);

  auto cfg                 = localConfig();
  cfg.abr.low_water        = 10ms;
  cfg.abr.high_water       = 100ms;
  cfg.abr.buffer_target    = 3000ms;
  cfg.fetch.max_in_flight  = 1;

  auto       requests = std::make_shared<std::vector<Url>>();
  const auto body     = goodSegment();
  components::client::TransportFactory scripted =
    [requests, body](boost::asio::io_context& ioc) -> fetch::SegmentTransportPtr
  { return std::make_unique<ScriptedTransport>(ioc, body, requests); };

  codec::SegmentDecoder             decoder;
  RecordingSink                     sink;
  components::client::StreamSession session(cfg, scripted, decoder, sink);

  session.play(manifest);

  std::size_t high_requests = 0;
  for (std::size_t i = 0; i < requests->size(); ++i)
  {
    const auto& url = (*requests)[i];
    if (url.find("/high/") == std::string::npos)
      continue;

    ++high_requests;
    // the very next request is the same segment at the lowest tier
    const auto segment = url.substr(url.rfind('/'));
    ASSERT_LT(i + 1, requests->size()) << url;
    EXPECT_EQ((*requests)[i + 1], "http://scripted.test/low" + segment);
  }

  const auto& metrics = session.metrics();
  EXPECT_GE(high_requests, 1u);
  EXPECT_EQ(metrics.segments_unavailable.load(), high_requests);
  EXPECT_EQ(metrics.segments_downloaded.load(), 6u);
  EXPECT_EQ(metrics.frames_presented.load() + metrics.frames_dropped.load(), 30u);
  EXPECT_EQ(sink.missing, 0);
  EXPECT_EQ(sink.ends, 1);
}
