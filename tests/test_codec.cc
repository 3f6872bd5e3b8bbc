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

#include <gtest/gtest.h>
#include <libvvplay/codec/entry.hpp>
#include <libvvplay/common/error.hpp>

using namespace libvvplay;
using namespace libvvplay::codec;
using decoder::PointCloud;

namespace
{

auto sampleFrames() -> std::vector<PointCloud>
{
  std::vector<PointCloud> frames(3);
  for (std::size_t f = 0; f < frames.size(); ++f)
  {
    for (int i = 0; i < 50; ++i)
    {
      frames[f].push_back({static_cast<float>(i) * 0.5F, -1.25F, static_cast<float>(f),
                           static_cast<ui8>(i), 128, 255, 200});
    }
  }
  frames[1].clear(); // an empty frame is legal
  return frames;
}

auto encoded(const SegmentBuffer& bytes, FrameCount frames) -> decoder::EncodedSegment
{
  decoder::EncodedSegment seg;
  seg.representation        = "q1";
  seg.reference.index       = 4;
  seg.reference.frame_count = frames;
  seg.bytes                 = bytes;
  return seg;
}

} // namespace

TEST(SegmentCodecTest, CompressedAndRawSegmentsDecodeToTheSameFrames)
{
  const auto frames = sampleFrames();

  const auto packed = encodeSegment(frames, /*compress=*/true);
  const auto raw    = encodeSegment(frames, /*compress=*/false);

  EXPECT_EQ(packed[5], FLAG_ZSTD);
  EXPECT_EQ(raw[5], 0);
  EXPECT_EQ(raw.size(), HEADER_SIZE + 3 * 4 + 100 * POINT_RECORD_SIZE);

  EXPECT_EQ(SegmentDecoder::decodeBytes(packed), frames);
  EXPECT_EQ(SegmentDecoder::decodeBytes(raw), frames);
}

TEST(SegmentCodecTest, DecoderChecksFrameCountAgainstReference)
{
  SegmentDecoder decoder;
  const auto     bytes = encodeSegment(sampleFrames());

  EXPECT_EQ(decoder.decode(encoded(bytes, 3)).size(), 3u);
  EXPECT_THROW(decoder.decode(encoded(bytes, 30)), DecodeError);
}

TEST(SegmentCodecTest, BadHeaderIsRejected)
{
  auto bytes = encodeSegment(sampleFrames(), false);

  auto bad_magic = bytes;
  bad_magic[0]   = 'X';
  EXPECT_THROW(SegmentDecoder::decodeBytes(bad_magic), DecodeError);

  auto bad_version = bytes;
  bad_version[4]   = 9;
  EXPECT_THROW(SegmentDecoder::decodeBytes(bad_version), DecodeError);

  EXPECT_THROW(SegmentDecoder::decodeBytes(SegmentBuffer{'V', 'V'}), DecodeError);
}

TEST(SegmentCodecTest, TruncatedOrPaddedPayloadIsRejected)
{
  auto bytes = encodeSegment(sampleFrames(), false);

  auto truncated = bytes;
  truncated.resize(truncated.size() - 7);
  EXPECT_THROW(SegmentDecoder::decodeBytes(truncated), DecodeError);

  auto padded = bytes;
  padded.push_back(0);
  EXPECT_THROW(SegmentDecoder::decodeBytes(padded), DecodeError);
}

TEST(SegmentCodecTest, CorruptZstdPayloadIsRejected)
{
  auto bytes = encodeSegment(sampleFrames(), true);
  for (std::size_t i = HEADER_SIZE; i < HEADER_SIZE + 4 && i < bytes.size(); ++i)
    bytes[i] = 0;

  EXPECT_THROW(SegmentDecoder::decodeBytes(bytes), DecodeError);
}
