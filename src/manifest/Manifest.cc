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
#include <cmath>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <set>
#include <stdexcept>

namespace libvvplay::manifest
{

namespace
{

// Aligned segments may be expressed in different timescales; allow for rounding
constexpr MediaDuration TIMELINE_TOLERANCE{1};

auto framesIn(MediaDuration duration, double fps) -> FrameCount
{
  const double seconds = std::chrono::duration<double>(duration).count();
  return static_cast<FrameCount>(std::llround(seconds * fps));
}

} // namespace

Manifest::Manifest(std::vector<Representation> reps, double fps)
    : m_representations(std::move(reps)), m_fps(fps)
{
  validate();
}

auto Manifest::fromRepresentations(std::vector<Representation> reps, double fps) -> Manifest
{
  return {std::move(reps), fps};
}

auto Manifest::fromLocalFiles(std::vector<AbsPath> files, double fps,
                              FrameCount frames_per_segment) -> Manifest
{
  if (files.empty())
    throw ManifestError("No local segment files given");
  if (fps <= 0.0 || frames_per_segment == 0)
    throw ManifestError("Local playback needs a positive frame rate and segment size");

  std::sort(files.begin(), files.end());

  const auto segment_duration = std::chrono::duration_cast<MediaDuration>(
    std::chrono::duration<double>(static_cast<double>(frames_per_segment) / fps));

  Representation local;
  local.id        = "local";
  local.bandwidth = 0;
  for (size_t i = 0; i < files.size(); ++i)
  {
    SegmentReference ref;
    ref.index    = i;
    ref.number   = i;
    ref.duration = segment_duration;
    ref.url      = "file://" + files[i];
    local.segments.push_back(std::move(ref));
  }

  log::INFO<log::MANIFEST>("Built local manifest from {} segment file(s) at {} fps", files.size(),
                           fps);

  std::vector<Representation> reps;
  reps.push_back(std::move(local));
  return {std::move(reps), fps};
}

void Manifest::validate()
{
  if (m_representations.empty())
    throw EmptyManifestError();

  if (!(m_fps > 0.0))
    throw ManifestError("Manifest frame rate must be positive");

  std::set<RepresentationID> seen;
  for (const auto& rep : m_representations)
  {
    if (rep.id.empty())
      throw ManifestError("Representation without an id");
    if (!seen.insert(rep.id).second)
      throw ManifestError("Duplicate Representation id '" + rep.id + "'");
  }

  std::stable_sort(m_representations.begin(), m_representations.end(),
                   [](const Representation& a, const Representation& b)
                   {
                     if (a.bandwidth != b.bandwidth)
                       return a.bandwidth < b.bandwidth;
                     return a.id < b.id;
                   });

  const Representation& reference = m_representations.front();
  const size_t          count     = reference.segments.size();
  if (count == 0)
    throw ManifestError("Representation '" + reference.id + "' has no segments");

  for (const auto& rep : m_representations)
  {
    if (rep.segments.size() != count)
    {
      throw InconsistentTimelineError(
        "Representation '" + rep.id + "' has " + std::to_string(rep.segments.size()) +
        " segments, '" + reference.id + "' has " + std::to_string(count));
    }

    for (size_t i = 0; i < count; ++i)
    {
      const auto delta = rep.segments[i].duration - reference.segments[i].duration;
      if (delta > TIMELINE_TOLERANCE || delta < -TIMELINE_TOLERANCE)
      {
        throw InconsistentTimelineError("Segment " + std::to_string(i) + " of '" + rep.id +
                                        "' lasts " +
                                        std::to_string(rep.segments[i].duration.count()) +
                                        "us, '" + reference.id + "' lasts " +
                                        std::to_string(reference.segments[i].duration.count()) +
                                        "us");
      }
    }
  }

  // Timing is shared, derive it once from the reference and stamp every tier
  MediaTime  start{0};
  FrameSeq   first_frame = 0;
  for (size_t i = 0; i < count; ++i)
  {
    const MediaDuration duration = reference.segments[i].duration;
    if (duration <= MediaDuration::zero())
      throw ManifestError("Segment " + std::to_string(i) + " has a non-positive duration");

    const FrameCount frames = framesIn(duration, m_fps);
    if (frames == 0)
      throw ManifestError("Segment " + std::to_string(i) + " is shorter than one frame");

    for (auto& rep : m_representations)
    {
      auto& ref       = rep.segments[i];
      ref.index       = i;
      ref.start       = start;
      ref.duration    = duration;
      ref.first_frame = first_frame;
      ref.frame_count = frames;
    }

    start += duration;
    first_frame += frames;
  }

  log::DBG<log::MANIFEST>("Manifest validated: {} Representation(s), {} segment(s), {} frame(s)",
                          m_representations.size(), count, first_frame);
}

auto Manifest::segmentReference(const RepresentationID& rep_id, SegmentIndex index) const
  -> const SegmentReference&
{
  const Representation& rep = representation(rep_id);
  if (index >= rep.segments.size())
    throw std::out_of_range("Segment index " + std::to_string(index) + " out of range for '" +
                            rep_id + "'");
  return rep.segments[index];
}

auto Manifest::representation(const RepresentationID& rep_id) const -> const Representation&
{
  auto idx = indexOf(rep_id);
  if (!idx)
    throw std::out_of_range("Unknown Representation '" + rep_id + "'");
  return m_representations[*idx];
}

auto Manifest::indexOf(const RepresentationID& rep_id) const -> std::optional<RepIdx>
{
  for (RepIdx i = 0; i < m_representations.size(); ++i)
  {
    if (m_representations[i].id == rep_id)
      return i;
  }
  return std::nullopt;
}

auto Manifest::totalFrames() const -> FrameCount
{
  const auto& last = lowest().segments.back();
  return last.first_frame + last.frame_count;
}

auto Manifest::totalDuration() const -> MediaDuration
{
  const auto& last = lowest().segments.back();
  return last.start + last.duration;
}

} // namespace libvvplay::manifest
