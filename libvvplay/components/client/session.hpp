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
#include <functional>
#include <libvvplay/abrate/ABRManager.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/decoder/entry.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <libvvplay/playback/render_loop.hpp>
#include <libvvplay/tsfetcher/entry.hpp>
#include <memory>
#include <optional>

namespace libvvplay::components::client
{

using TransportFactory = std::function<fetch::SegmentTransportPtr(boost::asio::io_context&)>;

/*
 * STREAM SESSION
 *
 * Wires one playback of one manifest:
 *
 *   ABR -> fetch scheduler -> decode pipeline -> playback queue -> render loop -> sink
 *
 * The control loop (ABR decisions, fetch issue, throughput samples, fetch
 * recovery) runs on the session's io_context, on the thread that called
 * play(). Decoding runs on the pipeline's workers and pacing on the render
 * loop's thread.
 *
 * A fetch is issued only while the scheduler has a free slot and the content
 * already queued, decoding or downloading is below the buffer target.
 */
class VVPLAY_API StreamSession
{
public:
  StreamSession(config::PlayerConfig cfg, const TransportFactory& make_transport,
                decoder::IFrameDecoder& decoder, playback::IFrameSink& sink);
  ~StreamSession();

  StreamSession(const StreamSession&)                    = delete;
  auto operator=(const StreamSession&) -> StreamSession& = delete;

  // Fetches the manifest through the session's transport (with the usual
  // retry policy) and parses it. Throws FetchError or ManifestError.
  auto loadManifest(const Url& url) -> manifest::Manifest;

  // Blocks until the last frame was presented or stop() was called.
  // Rethrows an exception that killed the render loop.
  void play(const manifest::Manifest& manifest);

  // Safe from any thread. Cancels fetches and decode work, joins the render
  // thread and releases every queued frame.
  void stop();

  [[nodiscard]] auto metrics() const -> const playback::PlaybackMetrics& { return m_metrics; }
  [[nodiscard]] auto estimator() const -> const abr::ThroughputEstimator& { return *m_estimator; }
  [[nodiscard]] auto config() const -> const config::PlayerConfig& { return m_cfg; }

private:
  struct Pipeline;

  config::PlayerConfig            m_cfg;
  boost::asio::io_context         m_ioc;
  fetch::SegmentTransportPtr      m_transport;
  fetch::SegmentFetchScheduler    m_scheduler;
  decoder::IFrameDecoder&         m_decoder;
  playback::IFrameSink&           m_sink;
  playback::PlaybackMetrics       m_metrics;
  boost::asio::steady_timer       m_controlTimer;

  std::unique_ptr<abr::ThroughputEstimator> m_estimator;
  std::unique_ptr<Pipeline>                 m_pipeline;
  const manifest::Manifest*                 m_manifest = nullptr;

  SegmentIndex          m_nextSegment = 0;
  std::optional<RepIdx> m_lastChoice;
  MediaDuration         m_downloading{0};
  ui64                  m_seenStalls = 0;
  bool                  m_stopping   = false;

  void controlStep();
  void armControlTimer();
  void issueNext();
  void onFetched(const boost::system::error_code& ec, fetch::FetchedSegment segment,
                 bool fallback);
  void teardown();
  [[nodiscard]] auto bufferedAhead() const -> MediaDuration;
};

} // namespace libvvplay::components::client
