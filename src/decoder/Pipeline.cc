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
#include <boost/asio/post.hpp>
#include <libvvplay/decoder/entry.hpp>
#include <libvvplay/log-macros.hpp>

namespace libvvplay::decoder
{

DecodePipeline::DecodePipeline(IFrameDecoder& decoder, playback::PlaybackQueue& queue,
                               abr::BufferOccupancy& occupancy, const config::DecodeConfig& cfg,
                               FrameSeq first_seq)
    : m_decoder(decoder), m_queue(queue), m_occupancy(occupancy),
      m_pool(std::max<std::size_t>(cfg.workers, 1)), m_reorder(first_seq)
{
  log::DBG<log::DECODER>("Decode pipeline up with {} worker(s)", std::max<std::size_t>(cfg.workers, 1));
}

DecodePipeline::~DecodePipeline() { stop(); }

auto DecodePipeline::frameTiming(const manifest::SegmentReference& ref, std::size_t i)
  -> std::pair<MediaTime, MediaDuration>
{
  const auto n     = static_cast<i64>(std::max<FrameCount>(ref.frame_count, 1));
  const auto span  = ref.duration.count();
  const auto begin = span * static_cast<i64>(i) / n;
  const auto end   = span * static_cast<i64>(i + 1) / n;
  return {ref.start + MediaDuration(begin), MediaDuration(end - begin)};
}

auto DecodePipeline::placeholders(const RepresentationID&           rep_id,
                                  const manifest::SegmentReference& ref)
  -> std::vector<DecodedFrame>
{
  std::vector<DecodedFrame> frames(ref.frame_count);
  for (std::size_t i = 0; i < frames.size(); ++i)
  {
    auto& f                   = frames[i];
    f.seq                     = ref.first_frame + i;
    std::tie(f.pts, f.duration) = frameTiming(ref, i);
    f.segment                 = ref.index;
    f.representation          = rep_id;
    f.missing                 = true;
  }
  return frames;
}

void DecodePipeline::submit(EncodedSegment segment)
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped)
      return;
    m_pending += segment.reference.duration;
  }

  boost::asio::post(m_pool, [this, segment = std::move(segment)]() { decodeOne(segment); });
}

void DecodePipeline::submitMissing(const RepresentationID&           rep_id,
                                   const manifest::SegmentReference& ref, const std::string& reason)
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped)
      return;
    m_pending += ref.duration;
  }

  log::WARN<log::DECODER>("Segment {} of '{}' is missing ({}), inserting {} placeholder frame(s)",
                          ref.index, rep_id, reason, ref.frame_count);
  release(placeholders(rep_id, ref));
  ++m_completed;
}

void DecodePipeline::decodeOne(const EncodedSegment& segment)
{
  const auto& ref = segment.reference;

  std::vector<DecodedFrame> frames;
  try
  {
    auto clouds = m_decoder.decode(segment);
    if (clouds.size() != ref.frame_count)
    {
      throw DecodeError("Decoder produced " + std::to_string(clouds.size()) + " frame(s) for " +
                        std::to_string(ref.frame_count) + " expected");
    }

    frames.resize(clouds.size());
    for (std::size_t i = 0; i < clouds.size(); ++i)
    {
      auto& f                     = frames[i];
      f.seq                       = ref.first_frame + i;
      std::tie(f.pts, f.duration) = frameTiming(ref, i);
      f.segment                   = ref.index;
      f.representation            = segment.representation;
      f.points                    = std::move(clouds[i]);
    }
  }
  catch (const std::exception& e)
  {
    ++m_failed;
    log::WARN<log::DECODER>(LogMode::Async, "Segment {} of '{}' failed to decode: {}", ref.index,
                            segment.representation, e.what());
    frames = placeholders(segment.representation, ref);
    if (m_onFailure)
      m_onFailure(ref.index, segment.representation, e.what());
  }

  release(std::move(frames));
  ++m_completed;
}

void DecodePipeline::release(std::vector<DecodedFrame> frames)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_stopped)
    return;

  for (auto& f : frames)
    m_reorder.insert(std::move(f));

  auto ready = m_reorder.releaseReady();
  for (auto& f : ready)
  {
    m_pending = std::max(m_pending - f.duration, MediaDuration::zero());
    m_occupancy.onFrameEnqueued(f.duration);
    m_queue.push(std::move(f));
  }

  if (!ready.empty())
    log::TRACE<log::DECODER>(LogMode::Async, "Released {} frame(s), cursor now {}", ready.size(),
                             m_reorder.cursor());
}

void DecodePipeline::stop()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopped)
      return;
    m_stopped = true;
    m_pending = MediaDuration::zero();
  }

  m_pool.stop();
  m_pool.join();
  log::DBG<log::DECODER>("Decode pipeline stopped");
}

auto DecodePipeline::pendingDuration() const -> MediaDuration
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pending;
}

auto DecodePipeline::releaseCursor() const -> FrameSeq
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_reorder.cursor();
}

} // namespace libvvplay::decoder
