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
#include <libvvplay/components/client/session.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/utils/math/entry.hpp>

namespace asio = boost::asio;

namespace libvvplay::components::client
{

struct StreamSession::Pipeline
{
  abr::BufferOccupancy        occupancy;
  playback::PlaybackQueue     queue;
  abr::ABRManager             abr;
  decoder::DecodePipeline     decode;
  playback::PlaybackScheduler clock;
  playback::RenderLoop        render;

  Pipeline(const config::PlayerConfig& cfg, const manifest::Manifest& manifest,
           decoder::IFrameDecoder& decoder, playback::IFrameSink& sink,
           playback::PlaybackMetrics& metrics)
      : occupancy(abr::defaultUnderflowPolicy()), queue(0), abr(cfg.abr),
        decode(decoder, queue, occupancy, cfg.decode, 0),
        clock(queue, occupancy, metrics, manifest.totalFrames(), 0),
        render(clock, queue, sink, cfg.playback)
  {
  }
};

StreamSession::StreamSession(config::PlayerConfig cfg, const TransportFactory& make_transport,
                             decoder::IFrameDecoder& decoder, playback::IFrameSink& sink)
    : m_cfg(std::move(cfg)), m_ioc(), m_transport(make_transport(m_ioc)),
      m_scheduler(m_ioc, *m_transport, m_cfg.fetch), m_decoder(decoder), m_sink(sink),
      m_controlTimer(m_ioc)
{
  log::DBG<log::SESSION>("Session created on '{}' transport", m_transport->name());
}

StreamSession::~StreamSession()
{
  if (m_pipeline)
  {
    m_pipeline->render.stop();
    m_pipeline->decode.stop();
  }
}

auto StreamSession::loadManifest(const Url& url) -> manifest::Manifest
{
  log::INFO<log::SESSION>("Fetching manifest '{}'", url);

  boost::system::error_code      error;
  std::optional<fetch::TransferResult> response;

  m_scheduler.fetchResource(url,
                            [&](const boost::system::error_code& ec, fetch::TransferResult result)
                            {
                              error = ec;
                              if (!ec)
                                response = std::move(result);
                            });

  m_ioc.restart();
  m_ioc.run();

  if (error || !response)
  {
    throw FetchError("Manifest '" + url + "' unavailable: " +
                     (error ? error.message() : std::string("no response")));
  }

  const ManifestData raw(response->body.begin(), response->body.end());
  auto               manifest = manifest::Manifest::parse(raw, url);

  log::INFO<log::SESSION>("Manifest: {} Representation(s), {} segment(s), {} frame(s) at {} fps",
                          manifest.representationList().size(), manifest.segmentCount(),
                          manifest.totalFrames(), manifest.frameRate());
  return manifest;
}

void StreamSession::play(const manifest::Manifest& manifest)
{
  m_manifest    = &manifest;
  m_nextSegment = 0;
  m_lastChoice.reset();
  m_downloading = MediaDuration::zero();
  m_seenStalls  = m_metrics.stalls.load();
  m_stopping    = false;

  m_estimator = std::make_unique<abr::ThroughputEstimator>(manifest.lowest().bandwidth,
                                                           m_cfg.throughput.decay);
  m_pipeline  = std::make_unique<Pipeline>(m_cfg, manifest, m_decoder, m_sink, m_metrics);

  m_pipeline->decode.onDecodeFailure(
    [this](SegmentIndex, const RepresentationID&, const std::string&)
    {
      asio::post(m_ioc,
                 [this]()
                 {
                   ++m_metrics.decode_failures;
                   if (m_pipeline && !m_stopping)
                     m_pipeline->abr.reportDecodeFailure();
                 });
    });
  m_pipeline->render.onFinished([this]() { asio::post(m_ioc, [this]() { teardown(); }); });

  log::INFO<log::SESSION>("Playing {} segment(s), buffer target {} ms, {} fetch slot(s)",
                          manifest.segmentCount(),
                          std::chrono::duration_cast<Millis>(m_cfg.abr.buffer_target).count(),
                          m_scheduler.maxInFlight());

  m_pipeline->render.start();
  asio::post(m_ioc, [this]() { controlStep(); });

  m_ioc.restart();
  m_ioc.run();

  // Scoped teardown: nothing below may leave frames or occupancy behind
  m_pipeline->render.stop();
  m_pipeline->decode.stop();
  const auto released = m_pipeline->queue.clear();
  m_pipeline->occupancy.reset();
  m_metrics.buffer_us = 0;

  if (released > MediaDuration::zero())
    log::DBG<log::SESSION>("Released {} ms of unplayed frames",
                           std::chrono::duration_cast<Millis>(released).count());

  log::INFO<log::SESSION>("Session finished:\n{}", playback::MetricsSerializer::toText(m_metrics));

  auto error = m_pipeline->render.error();
  m_pipeline.reset();
  m_manifest = nullptr;

  if (error)
    std::rethrow_exception(error);
}

void StreamSession::stop()
{
  asio::post(m_ioc, [this]() { teardown(); });
}

void StreamSession::teardown()
{
  if (m_stopping)
    return;
  m_stopping = true;

  log::INFO<log::SESSION>("Tearing down session");
  m_controlTimer.cancel();
  m_scheduler.cancelAll();
  if (m_pipeline)
    m_pipeline->render.stop();
}

auto StreamSession::bufferedAhead() const -> MediaDuration
{
  return m_pipeline->occupancy.occupancy() + m_pipeline->decode.pendingDuration() + m_downloading;
}

void StreamSession::armControlTimer()
{
  m_controlTimer.expires_after(m_cfg.playback.control_poll);
  m_controlTimer.async_wait(
    [this](const boost::system::error_code& ec)
    {
      if (!ec)
        controlStep();
    });
}

void StreamSession::controlStep()
{
  if (m_stopping || !m_pipeline)
    return;

  auto& p = *m_pipeline;

  const auto stalls = m_metrics.stalls.load();
  if (stalls > m_seenStalls)
  {
    m_seenStalls = stalls;
    p.abr.reportUnderrun();
    log::WARN<log::SESSION>("Playback stalled ({} so far), next decision drops to the lowest tier",
                            stalls);
  }

  m_metrics.buffer_us = p.occupancy.occupancy().count();

  while (m_nextSegment < m_manifest->segmentCount() && m_scheduler.hasFreeSlot() &&
         bufferedAhead() < m_cfg.abr.buffer_target)
  {
    issueNext();
  }

  armControlTimer();
}

void StreamSession::issueNext()
{
  auto&       p     = *m_pipeline;
  const auto& reps  = m_manifest->representationList();
  const auto  index = m_nextSegment++;

  const auto& rep = p.abr.selectNext(reps, m_estimator->estimate(), p.occupancy.occupancy(),
                                     m_cfg.abr.buffer_target, m_lastChoice);
  const auto chosen = p.abr.lastDecision()->chosen;

  if (m_lastChoice && chosen != *m_lastChoice)
    ++m_metrics.abr_switches;
  m_lastChoice                       = chosen;
  m_metrics.current_representation = chosen;

  const auto& ref = rep.segments.at(index);
  m_downloading += ref.duration;

  m_scheduler.fetch(rep.id, ref,
                    [this](const boost::system::error_code& ec, fetch::FetchedSegment segment)
                    { onFetched(ec, std::move(segment), false); });
}

void StreamSession::onFetched(const boost::system::error_code& ec, fetch::FetchedSegment segment,
                              bool fallback)
{
  const auto& ref = segment.reference;

  if (ec == asio::error::operation_aborted || m_stopping || !m_pipeline)
  {
    m_downloading = std::max(m_downloading - ref.duration, MediaDuration::zero());
    return;
  }

  auto& p = *m_pipeline;

  if (!ec)
  {
    m_downloading = std::max(m_downloading - ref.duration, MediaDuration::zero());
    m_estimator->record(segment.sample);
    m_metrics.bytes_downloaded += segment.bytes.size();
    ++m_metrics.segments_downloaded;

    log::DBG<log::SESSION>("Segment {} of '{}' in: {} ({} attempt(s)), estimate {}", ref.index,
                           segment.representation, utils::math::bytesFormat(segment.bytes.size()),
                           segment.attempts, utils::math::bitrateFormat(m_estimator->estimate()));

    p.decode.submit({segment.representation, ref, std::move(segment.bytes)});
    controlStep();
    return;
  }

  ++m_metrics.segments_unavailable;
  const SegmentUnavailableError failure(segment.representation, ref.index, segment.attempts,
                                        segment.last_error);
  log::WARN<log::SESSION>("{}", failure.what());
  p.abr.reportFetchFailure();

  const auto& lowest = m_manifest->lowest();
  if (!fallback && segment.representation != lowest.id)
  {
    log::INFO<log::SESSION>("Refetching segment {} at '{}'", ref.index, lowest.id);
    m_scheduler.fetch(lowest.id, lowest.segments.at(ref.index),
                      [this](const boost::system::error_code& ec, fetch::FetchedSegment segment)
                      { onFetched(ec, std::move(segment), true); });
    return;
  }

  m_downloading = std::max(m_downloading - ref.duration, MediaDuration::zero());
  p.decode.submitMissing(segment.representation, ref, failure.what());
  controlStep();
}

} // namespace libvvplay::components::client
