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
#include <libvvplay/decoder/interface.hpp>

/*
 * VVSG SEGMENT CONTAINER
 *
 *   offset  size  field
 *   0       4     magic "VVSG"
 *   4       1     version (1)
 *   5       1     flags (bit 0: payload is one zstd frame)
 *   6       2     reserved, zero
 *   8       4     frame count (u32 LE)
 *   12      ...   payload
 *
 * The (decompressed) payload is `frame count` frames, each a u32 LE point
 * count followed by that many 15 byte records: f32 LE x, y, z then u8 r, g,
 * b, a.
 */

namespace libvvplay::codec
{

inline constexpr ui8         SEGMENT_VERSION   = 1;
inline constexpr ui8         FLAG_ZSTD         = 0x01;
inline constexpr std::size_t HEADER_SIZE       = 12;
inline constexpr std::size_t POINT_RECORD_SIZE = 15;

class VVPLAY_API SegmentDecoder final : public decoder::IFrameDecoder
{
public:
  // Checks the frame count against the SegmentReference, throws DecodeError
  auto decode(const decoder::EncodedSegment& segment) -> std::vector<decoder::PointCloud> override;

  // Container parsing without the reference check
  static auto decodeBytes(const SegmentBuffer& bytes) -> std::vector<decoder::PointCloud>;
};

// Writes `frames` in the layout above, zstd-compressed at `level` when `compress`
VVPLAY_API auto encodeSegment(const std::vector<decoder::PointCloud>& frames, bool compress = true,
                              int level = 3) -> SegmentBuffer;

} // namespace libvvplay::codec
