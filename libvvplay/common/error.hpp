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

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <libvvplay/common/api/entry.hpp>
#include <libvvplay/common/types.hpp>

namespace libvvplay
{

/*
 * ERROR TAXONOMY
 *
 * ManifestError          -> fatal, aborts stream start
 * FetchError             -> recoverable, retried by the fetch scheduler
 * SegmentUnavailableError-> recoverable at stream level (downgrade / placeholders)
 * DecodeError            -> recoverable at frame granularity (placeholders)
 * BufferUnderflowError   -> invariant violation (throws in tests, clamps in release)
 * ConfigError            -> fatal, bad configuration file or flag
 *
 * A stall is NOT an error, see playback::TickStatus::Stall.
 */
class VVPLAY_API Error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

class VVPLAY_API ManifestError : public Error
{
public:
  using Error::Error;
};

class VVPLAY_API EmptyManifestError : public ManifestError
{
public:
  EmptyManifestError() : ManifestError("Manifest declares no Representations") {}
};

class VVPLAY_API InconsistentTimelineError : public ManifestError
{
public:
  using ManifestError::ManifestError;
};

class VVPLAY_API FetchError : public Error
{
public:
  using Error::Error;
};

class VVPLAY_API SegmentUnavailableError : public FetchError
{
public:
  SegmentUnavailableError(RepresentationID rep_id, SegmentIndex index, int attempts,
                          const std::string& last_error)
      : FetchError("Segment " + std::to_string(index) + " of '" + rep_id + "' unavailable after " +
                   std::to_string(attempts) + " attempt(s): " + last_error),
        m_repId(std::move(rep_id)), m_index(index), m_attempts(attempts)
  {
  }

  [[nodiscard]] auto representation() const -> const RepresentationID& { return m_repId; }
  [[nodiscard]] auto index() const -> SegmentIndex { return m_index; }
  [[nodiscard]] auto attempts() const -> int { return m_attempts; }

private:
  RepresentationID m_repId;
  SegmentIndex     m_index;
  int              m_attempts;
};

class VVPLAY_API DecodeError : public Error
{
public:
  using Error::Error;
};

class VVPLAY_API BufferUnderflowError : public Error
{
public:
  using Error::Error;
};

class VVPLAY_API ConfigError : public Error
{
public:
  using Error::Error;
};

namespace fetch
{

enum class error
{
  http_client_error = 1, // 4xx, never retried
  http_server_error,     // 5xx, transient
  malformed_response,
  segment_unavailable // retries exhausted
};

auto error_category() -> const boost::system::error_category&;

inline auto make_error_code(error e) -> boost::system::error_code
{
  return {static_cast<int>(e), error_category()};
}

// Timeouts, resets and 5xx are worth another attempt; 4xx and cancellation are not.
auto is_transient(const boost::system::error_code& ec) -> bool;

} // namespace fetch

} // namespace libvvplay

template <> struct boost::system::is_error_code_enum<libvvplay::fetch::error> : std::true_type
{
};
