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

#include <libvvplay/decoder/interface.hpp>

namespace libvvplay::playback
{

// The renderer seam. Called from the render loop thread only.
class IFrameSink
{
public:
  virtual ~IFrameSink() = default;

  // Missing frames arrive with `missing` set and no points; a renderer
  // usually keeps showing the previous frame.
  virtual void present(const decoder::DecodedFrame& frame) = 0;

  virtual void onStall(FrameSeq /*waiting_for*/) {}
  virtual void onResume(FrameSeq /*seq*/) {}
  virtual void onEndOfStream() {}
};

} // namespace libvvplay::playback
