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
#include <cstring>
#include <libvvplay/codec/entry.hpp>
#include <libvvplay/common/error.hpp>
#include <libvvplay/common/macros.hpp>
#include <libvvplay/log-macros.hpp>
#include <zstd.h>

namespace libvvplay::codec
{

namespace
{

constexpr std::size_t MAX_PAYLOAD_BYTES =
  static_cast<std::size_t>(VVPLAY_MAX_SEGMENT_SIZE_MIBS) * 1024 * 1024;

class ByteReader
{
public:
  ByteReader(const ui8* data, std::size_t size) : m_data(data), m_size(size) {}

  auto u8() -> ui8
  {
    need(1);
    return m_data[m_pos++];
  }

  auto u32() -> ui32
  {
    need(4);
    ui32 v = static_cast<ui32>(m_data[m_pos]) | (static_cast<ui32>(m_data[m_pos + 1]) << 8) |
             (static_cast<ui32>(m_data[m_pos + 2]) << 16) |
             (static_cast<ui32>(m_data[m_pos + 3]) << 24);
    m_pos += 4;
    return v;
  }

  auto f32() -> float
  {
    const ui32 bits = u32();
    float      v    = 0.0F;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
  }

  void need(std::size_t n) const
  {
    if (m_size - m_pos < n)
      throw DecodeError("Segment truncated at byte " + std::to_string(m_pos));
  }

  [[nodiscard]] auto remaining() const -> std::size_t { return m_size - m_pos; }

private:
  const ui8*  m_data;
  std::size_t m_size;
  std::size_t m_pos = 0;
};

void putU32(SegmentBuffer& out, ui32 v)
{
  out.push_back(static_cast<ui8>(v & 0xFF));
  out.push_back(static_cast<ui8>((v >> 8) & 0xFF));
  out.push_back(static_cast<ui8>((v >> 16) & 0xFF));
  out.push_back(static_cast<ui8>((v >> 24) & 0xFF));
}

void putF32(SegmentBuffer& out, float v)
{
  ui32 bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  putU32(out, bits);
}

auto decompress(const ui8* src, std::size_t size) -> SegmentBuffer
{
  const unsigned long long content = ZSTD_getFrameContentSize(src, size);
  if (content == ZSTD_CONTENTSIZE_ERROR)
    throw DecodeError("Segment payload is not a zstd frame");
  if (content == ZSTD_CONTENTSIZE_UNKNOWN)
    throw DecodeError("Segment payload does not declare its decompressed size");
  if (content > MAX_PAYLOAD_BYTES)
    throw DecodeError("Segment payload of " + std::to_string(content) + " bytes exceeds the limit");

  SegmentBuffer out(static_cast<std::size_t>(content));
  const size_t  written = ZSTD_decompress(out.data(), out.size(), src, size);
  if (ZSTD_isError(written))
    throw DecodeError(std::string("zstd decompression failed: ") + ZSTD_getErrorName(written));
  if (written != out.size())
    throw DecodeError("zstd decompression size mismatch");
  return out;
}

} // namespace

auto SegmentDecoder::decodeBytes(const SegmentBuffer& bytes) -> std::vector<decoder::PointCloud>
{
  if (bytes.size() < HEADER_SIZE)
    throw DecodeError("Segment shorter than its header");

  const auto magic = macros::SEGMENT_MAGIC;
  if (std::memcmp(bytes.data(), magic.data(), magic.size()) != 0)
    throw DecodeError("Bad segment magic");

  ByteReader header(bytes.data() + magic.size(), HEADER_SIZE - magic.size());
  const ui8  version = header.u8();
  const ui8  flags   = header.u8();
  header.u8();
  header.u8();
  const ui32 frame_count = header.u32();

  if (version != SEGMENT_VERSION)
    throw DecodeError("Unsupported segment version " + std::to_string(version));

  SegmentBuffer inflated;
  const ui8*    payload      = bytes.data() + HEADER_SIZE;
  std::size_t   payload_size = bytes.size() - HEADER_SIZE;
  if (flags & FLAG_ZSTD)
  {
    inflated     = decompress(payload, payload_size);
    payload      = inflated.data();
    payload_size = inflated.size();
  }

  ByteReader                       reader(payload, payload_size);
  std::vector<decoder::PointCloud> frames;
  // every frame costs at least its 4 byte point count
  frames.reserve(std::min<std::size_t>(frame_count, payload_size / 4));

  for (ui32 f = 0; f < frame_count; ++f)
  {
    const ui32 points = reader.u32();
    reader.need(static_cast<std::size_t>(points) * POINT_RECORD_SIZE);

    decoder::PointCloud cloud(points);
    for (auto& p : cloud)
    {
      p.x = reader.f32();
      p.y = reader.f32();
      p.z = reader.f32();
      p.r = reader.u8();
      p.g = reader.u8();
      p.b = reader.u8();
      p.a = reader.u8();
    }
    frames.push_back(std::move(cloud));
  }

  if (reader.remaining() != 0)
    throw DecodeError(std::to_string(reader.remaining()) + " trailing byte(s) after the last frame");

  return frames;
}

auto SegmentDecoder::decode(const decoder::EncodedSegment& segment)
  -> std::vector<decoder::PointCloud>
{
  auto frames = decodeBytes(segment.bytes);
  if (frames.size() != segment.reference.frame_count)
  {
    throw DecodeError("Segment " + std::to_string(segment.reference.index) + " of '" +
                      segment.representation + "' holds " + std::to_string(frames.size()) +
                      " frame(s), expected " + std::to_string(segment.reference.frame_count));
  }

  log::TRACE<log::DECODER>(LogMode::Async, "Decoded segment {} of '{}': {} frame(s), {} bytes",
                           segment.reference.index, segment.representation, frames.size(),
                           segment.bytes.size());
  return frames;
}

auto encodeSegment(const std::vector<decoder::PointCloud>& frames, bool compress, int level)
  -> SegmentBuffer
{
  SegmentBuffer payload;
  for (const auto& cloud : frames)
  {
    putU32(payload, static_cast<ui32>(cloud.size()));
    for (const auto& p : cloud)
    {
      putF32(payload, p.x);
      putF32(payload, p.y);
      putF32(payload, p.z);
      payload.push_back(p.r);
      payload.push_back(p.g);
      payload.push_back(p.b);
      payload.push_back(p.a);
    }
  }

  SegmentBuffer out;
  const auto    magic = macros::SEGMENT_MAGIC;
  out.insert(out.end(), magic.begin(), magic.end());
  out.push_back(SEGMENT_VERSION);
  out.push_back(compress ? FLAG_ZSTD : 0);
  out.push_back(0);
  out.push_back(0);
  putU32(out, static_cast<ui32>(frames.size()));

  if (!compress)
  {
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
  }

  const size_t bound  = ZSTD_compressBound(payload.size());
  const auto   offset = out.size();
  out.resize(offset + bound);
  const size_t written =
    ZSTD_compress(out.data() + offset, bound, payload.data(), payload.size(), level);
  if (ZSTD_isError(written))
    throw Error(std::string("zstd compression failed: ") + ZSTD_getErrorName(written));
  out.resize(offset + written);
  return out;
}

} // namespace libvvplay::codec
