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

#include <libvvplay/common/types.hpp>
#include <libvvplay/manifest/entry.hpp>
#include <vector>

namespace libvvplay::decoder
{

struct PointXyzRgba
{
  float x = 0.0F;
  float y = 0.0F;
  float z = 0.0F;
  ui8   r = 0;
  ui8   g = 0;
  ui8   b = 0;
  ui8   a = 255;

  auto operator==(const PointXyzRgba&) const -> bool = default;
};

using PointCloud = std::vector<PointXyzRgba>;

// Compressed bytes of one segment, as handed from the fetch side to decode
struct EncodedSegment
{
  RepresentationID           representation;
  manifest::SegmentReference reference;
  SegmentBuffer              bytes;
};

/*
 * One playback-ready frame. `missing` frames are placeholders for content
 * that could not be fetched or decoded: they carry correct timing and no
 * points, so the render clock never sees a gap in the sequence.
 */
struct DecodedFrame
{
  FrameSeq         seq{};
  MediaTime        pts{};
  MediaDuration    duration{};
  SegmentIndex     segment{};
  RepresentationID representation;
  bool             missing = false;
  PointCloud       points;
};

/*
 * The codec seam. Decoding is a pure transformation of one segment's bytes
 * into its frames, in presentation order, and is called concurrently from
 * the decode workers. Throws libvvplay::DecodeError on corrupt input.
 */
class IFrameDecoder
{
public:
  virtual ~IFrameDecoder() = default;

  virtual auto decode(const EncodedSegment& segment) -> std::vector<PointCloud> = 0;
};

} // namespace libvvplay::decoder
