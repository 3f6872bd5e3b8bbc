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

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <libvvplay/abrate/BufferOccupancy.hpp>
#include <libvvplay/config/entry.hpp>
#include <libvvplay/decoder/interface.hpp>
#include <libvvplay/playback/queue.hpp>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace libvvplay::decoder
{

/*
 * Sequence-keyed holding area for frames that finished decoding ahead of
 * their predecessors. Frames leave only as one contiguous run starting at
 * the release cursor. Not synchronized, the pipeline guards it.
 */
class ReorderBuffer
{
public:
  explicit ReorderBuffer(FrameSeq first_seq = 0) : m_cursor(first_seq) {}

  // Throws std::logic_error for a sequence already released or already held
  void insert(DecodedFrame frame)
  {
    if (frame.seq < m_cursor || m_pending.count(frame.seq) > 0)
      throw std::logic_error("Frame " + std::to_string(frame.seq) + " inserted twice");
    const auto seq = frame.seq;
    m_pending.emplace(seq, std::move(frame));
  }

  auto releaseReady() -> std::vector<DecodedFrame>
  {
    std::vector<DecodedFrame> ready;
    for (auto it = m_pending.begin(); it != m_pending.end() && it->first == m_cursor;
         it = m_pending.erase(it), ++m_cursor)
    {
      ready.push_back(std::move(it->second));
    }
    return ready;
  }

  [[nodiscard]] auto cursor() const -> FrameSeq { return m_cursor; }
  [[nodiscard]] auto held() const -> std::size_t { return m_pending.size(); }

  void reset(FrameSeq first_seq)
  {
    m_pending.clear();
    m_cursor = first_seq;
  }

private:
  std::map<FrameSeq, DecodedFrame> m_pending;
  FrameSeq                         m_cursor;
};

// Segment index, Representation id and reason of a failed decode
using DecodeFailureHandler =
  std::function<void(SegmentIndex, const RepresentationID&, const std::string&)>;

/*
 * DECODE PIPELINE
 *
 * Segments are decoded in parallel on a bounded worker pool, but frames
 * enter the PlaybackQueue strictly in sequence order through the reorder
 * buffer. A segment that fails to decode is replaced by missing-frame
 * placeholders with the same timing and the failure is reported through
 * the failure handler (called from a worker thread).
 *
 * Every frame released to the queue is also added to the BufferOccupancy.
 */
class VVPLAY_API DecodePipeline
{
public:
  DecodePipeline(IFrameDecoder& decoder, playback::PlaybackQueue& queue,
                 abr::BufferOccupancy& occupancy, const config::DecodeConfig& cfg,
                 FrameSeq first_seq = 0);
  ~DecodePipeline();

  DecodePipeline(const DecodePipeline&)                    = delete;
  auto operator=(const DecodePipeline&) -> DecodePipeline& = delete;

  void onDecodeFailure(DecodeFailureHandler handler) { m_onFailure = std::move(handler); }

  // Hands the segment to a worker, returns immediately. Ignored after stop().
  void submit(EncodedSegment segment);

  // The segment will never arrive: release placeholders for its frame range
  void submitMissing(const RepresentationID& rep_id, const manifest::SegmentReference& ref,
                     const std::string& reason);

  // No new work is accepted, queued decodes are abandoned, running ones are
  // waited for and their frames discarded
  void stop();

  // Playback time submitted but not yet released to the queue
  [[nodiscard]] auto pendingDuration() const -> MediaDuration;
  [[nodiscard]] auto completedCount() const -> std::size_t { return m_completed.load(); }
  [[nodiscard]] auto failedCount() const -> std::size_t { return m_failed.load(); }
  [[nodiscard]] auto releaseCursor() const -> FrameSeq;

  // Splits a segment's time span evenly across its frames. The sum of the
  // frame durations is exactly the segment duration.
  static auto frameTiming(const manifest::SegmentReference& ref, std::size_t i)
    -> std::pair<MediaTime, MediaDuration>;

private:
  IFrameDecoder&           m_decoder;
  playback::PlaybackQueue& m_queue;
  abr::BufferOccupancy&    m_occupancy;
  boost::asio::thread_pool m_pool;
  DecodeFailureHandler     m_onFailure;

  mutable std::mutex m_mutex;
  ReorderBuffer      m_reorder;
  MediaDuration      m_pending{0};
  bool               m_stopped = false;

  std::atomic<std::size_t> m_completed{0};
  std::atomic<std::size_t> m_failed{0};

  void decodeOne(const EncodedSegment& segment);
  void release(std::vector<DecodedFrame> frames);

  static auto placeholders(const RepresentationID& rep_id, const manifest::SegmentReference& ref)
    -> std::vector<DecodedFrame>;
};

} // namespace libvvplay::decoder
