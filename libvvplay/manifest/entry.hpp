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

#include <libvvplay/common/api/entry.hpp>
#include <libvvplay/common/error.hpp>
#include <libvvplay/common/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace libvvplay::manifest
{

/*
 * One addressable segment of one Representation. Segments at the same
 * index are time-aligned across all Representations of a Manifest, so the
 * timing fields (start, duration, first_frame, frame_count) are identical
 * for every tier; only the url differs.
 */
struct SegmentReference
{
  SegmentIndex  index{};
  ui64          number{}; // value substituted for $Number$
  MediaTime     start{};
  MediaDuration duration{};
  FrameSeq      first_frame{};
  FrameCount    frame_count{};
  Url           url;

  [[nodiscard]] auto frameDuration() const -> MediaDuration
  {
    return frame_count == 0 ? duration : duration / static_cast<i64>(frame_count);
  }
};

struct Representation
{
  RepresentationID              id;
  Bitrate                       bandwidth{};
  std::vector<SegmentReference> segments;

  // Local files carry no network cost and are modelled as a zero-bitrate tier
  [[nodiscard]] auto isLocal() const -> bool { return bandwidth == 0; }
};

class VVPLAY_API Manifest
{
public:
  // Parses an MPD document. `manifest_url` is the address the document was
  // fetched from and is used to resolve relative segment URLs.
  // Throws EmptyManifestError, InconsistentTimelineError or ManifestError.
  static auto parse(const ManifestData& raw, const Url& manifest_url = "") -> Manifest;

  // Builds a single degenerate Representation out of local segment files,
  // sorted by path. Throws ManifestError when `files` is empty.
  static auto fromLocalFiles(std::vector<AbsPath> files, double fps,
                             FrameCount frames_per_segment) -> Manifest;

  // Validates and orders an already-built set of Representations. Segment
  // timing fields are recomputed from the durations and `fps`.
  static auto fromRepresentations(std::vector<Representation> reps, double fps) -> Manifest;

  // Ascending by nominal bitrate (ties by id), the ABR engine relies on this order
  [[nodiscard]] auto representationList() const -> const std::vector<Representation>&
  {
    return m_representations;
  }

  // Throws std::out_of_range for an unknown id or index
  [[nodiscard]] auto segmentReference(const RepresentationID& rep_id, SegmentIndex index) const
    -> const SegmentReference&;

  [[nodiscard]] auto representation(const RepresentationID& rep_id) const -> const Representation&;
  [[nodiscard]] auto indexOf(const RepresentationID& rep_id) const -> std::optional<RepIdx>;

  [[nodiscard]] auto lowest() const -> const Representation& { return m_representations.front(); }
  [[nodiscard]] auto highest() const -> const Representation& { return m_representations.back(); }

  [[nodiscard]] auto segmentCount() const -> std::size_t { return lowest().segments.size(); }
  [[nodiscard]] auto frameRate() const -> double { return m_fps; }
  [[nodiscard]] auto totalFrames() const -> FrameCount;
  [[nodiscard]] auto totalDuration() const -> MediaDuration;

private:
  Manifest(std::vector<Representation> reps, double fps);

  void validate();

  std::vector<Representation> m_representations;
  double                      m_fps;
};

} // namespace libvvplay::manifest
