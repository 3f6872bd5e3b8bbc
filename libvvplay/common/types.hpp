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

// Contains typedefs for the entire project

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

//[ Int types ]//
using i8   = std::int8_t;
using i16  = std::int16_t;
using i32  = std::int32_t;
using i64  = std::int64_t;
using uint = unsigned int;
using ui8  = std::uint8_t;
using ui32 = std::uint32_t;
using ui64 = std::uint64_t;

//[ NETWORKING DEFS ]//
using IPAddr      = std::string; // Host name or IP address of a server
using PortNo      = std::string; // Port number (kept as string for the resolver)
using NetTarget   = std::string; // Requested target (path + query) on a server
using NetResponse = std::string; // Response body from server
using Url         = std::string; // Absolute or relative URL as written in a manifest

//[ DIRECTORY AND PATHS DEFS ]//
using Directory = std::string; // Directory represented as a string
using RelPath   = std::string; // Relative Path as a string (need not be of a file)
using AbsPath   = std::string; // Absolute Path as a string (need not be of a file)

//[ MANIFEST DEFS ]//
using ManifestData     = std::string; // The raw manifest (.mpd) document
using RepresentationID = std::string; // Stable identifier of a quality tier
using SegmentIndex     = std::size_t; // Position of a segment in the segment index
using Bitrate          = ui64;        // Bits per second
using RepIdx           = std::size_t; // Position of a Representation in bitrate order

//[ SEGMENT & FRAME DEFS ]//
using SegmentByte    = ui8;
using SegmentBuffer  = std::vector<SegmentByte>;
using ByteCount      = std::size_t;
using FrameSeq       = ui64; // Presentation sequence number of a frame
using FrameCount     = std::size_t;

//[ TIME DEFS ]//
using MediaDuration = std::chrono::microseconds; // Playback-time span
using MediaTime     = std::chrono::microseconds; // Presentation timestamp from stream start
using SteadyClock   = std::chrono::steady_clock;
using TimePoint     = SteadyClock::time_point;
using Millis        = std::chrono::milliseconds;

inline constexpr double BITS_PER_BYTE = 8.0;
