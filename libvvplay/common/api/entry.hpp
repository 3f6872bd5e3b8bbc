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

#if defined(_WIN32) || defined(_WIN64)
#define VVPLAY_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define VVPLAY_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define VVPLAY_PLATFORM_APPLE 1
#endif

// Visibility
#if defined(_WIN32)
#ifdef VVPLAY_EXPORTS
#define VVPLAY_API __declspec(dllexport)
#else
#define VVPLAY_API __declspec(dllimport)
#endif
#else
#define VVPLAY_API __attribute__((visibility("default")))
#endif

#define VVPLAY_NODISCARD [[nodiscard]]

#define VVPLAY_FORCE_INLINE inline __attribute__((always_inline))
#define VVPLAY_UNUSED(x)    (void)(x)
#define VVPLAY_LIKELY(x)    __builtin_expect(!!(x), 1)
#define VVPLAY_UNLIKELY(x)  __builtin_expect(!!(x), 0)
