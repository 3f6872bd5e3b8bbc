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

#if __cplusplus < 202002L
#error "VVPlay-Client requires C++20 or later."
#endif

#include <algorithm>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <libvvplay/codec/entry.hpp>
#include <libvvplay/common/macros.hpp>
#include <libvvplay/components/client/session.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/sim/network_trace.hpp>
#include <libvvplay/tsfetcher/methods/http/entry.hpp>
#include <libvvplay/tsfetcher/methods/local/entry.hpp>
#include <libvvplay/tsfetcher/methods/simulated/entry.hpp>
#include <libvvplay/utils/cmd-line/parser.hpp>
#include <libvvplay/utils/web/parser.hpp>
#include <optional>
#include <thread>

namespace fs     = std::filesystem;
namespace logger = libvvplay::log;
using Client     = libvvplay::log::CLIENT;

using namespace libvvplay;

namespace
{

// Headless renderer: logs progress instead of drawing
class LoggingSink final : public playback::IFrameSink
{
public:
  explicit LoggingSink(double fps) : m_every(std::max<ui64>(1, static_cast<ui64>(fps))) {}

  void present(const decoder::DecodedFrame& frame) override
  {
    ++m_frames;
    if (frame.missing)
      logger::WARN<Client>(LogMode::Async, "Frame {} is missing, holding the previous one",
                           frame.seq);
    else if (m_frames % m_every == 0)
      logger::INFO<Client>(LogMode::Async, "Frame {} @ {} ms: {} points from '{}'", frame.seq,
                           std::chrono::duration_cast<Millis>(frame.pts).count(),
                           frame.points.size(), frame.representation);
  }

  void onStall(FrameSeq waiting_for) override
  {
    logger::WARN<Client>(LogMode::Async, "Rebuffering, waiting for frame {}", waiting_for);
  }

  void onResume(FrameSeq seq) override
  {
    logger::INFO<Client>(LogMode::Async, "Playback resumed at frame {}", seq);
  }

  void onEndOfStream() override
  {
    logger::INFO<Client>(LogMode::Async, "End of stream after {} frame(s)", m_frames);
  }

private:
  ui64 m_every;
  ui64 m_frames = 0;
};

auto defaultConfigPath() -> std::optional<AbsPath>
{
  const char* home = std::getenv("HOME");
  if (!home)
    return std::nullopt;

  fs::path path = fs::path(home) / macros::to_string(macros::REL_PATH_CONFIG);
  if (!fs::exists(path))
    return std::nullopt;
  return path.string();
}

auto listSegments(const Directory& dir) -> std::vector<AbsPath>
{
  std::vector<AbsPath> files;
  for (const auto& entry : fs::directory_iterator(dir))
  {
    if (entry.is_regular_file() && entry.path().extension().string() == macros::SEGMENT_EXT)
      files.push_back(entry.path().string());
  }
  return files;
}

} // namespace

auto main(int argc, char* argv[]) -> int
{
  INIT_VVPLAY_LOGGER();

  utils::cmdline::CmdLineParser parser(std::span<char* const>(argv, argc));

  parser.register_args({
    {{"manifest"}, "MPD manifest to play: http(s) URL, file:// URL or path"},
    {{"config"}, "TOML player configuration (default: ~/.config/vvplay/vvplay.toml)"},
    {{"trace"}, "Replay segment downloads over this bandwidth trace (KB/s per line)"},
    {{"local"}, "Play the .vvs segments of this directory instead of a manifest"},
    {{"fps"}, "Frame rate of --local content (default 30)"},
    {{"framesPerSegment"}, "Frames per segment of --local content (default 30)"},
    {{"logLevel"}, "error | warn | trace | info | debug"},
    {{"maxInFlight"}, "Concurrent segment fetches (1-8)"},
    {{"workers"}, "Decode worker threads"},
    {{"insecure"}, "Skip TLS certificate verification (boolean flag)"},
  });

  try
  {
    if (parser.has("help"))
    {
      parser.print_usage(argv[0]);
      return VVPLAY_RET_SUC;
    }

    config::PlayerConfig cfg;
    if (auto path = parser.get<AbsPath>("config"))
      cfg = config::loadConfig(*path);
    else if (auto fallback = defaultConfigPath())
      cfg = config::loadConfig(*fallback);

    if (auto v = parser.get<std::size_t>("maxInFlight"))
      cfg.fetch.max_in_flight = *v;
    if (auto v = parser.get<std::size_t>("workers"))
      cfg.decode.workers = *v;
    if (auto v = parser.get<std::string>("logLevel"))
      cfg.log.level = *v;
    cfg.validate();

    if (auto level = logger::parse_log_level(cfg.log.level); level && !logger::log_level_from_env())
      logger::set_log_level(*level);

    const auto manifest_url = parser.get<Url>("manifest");
    const auto local_dir    = parser.get<Directory>("local");
    const auto trace_path   = parser.get<AbsPath>("trace");
    const auto fps          = parser.get_or<double>("fps", VVPLAY_DEFAULT_FPS);
    const auto per_segment  = parser.get_or<std::size_t>("framesPerSegment", VVPLAY_DEFAULT_FPS);
    const bool insecure     = parser.get_bool("insecure");

    if (!parser.warn_unknown_args())
    {
      parser.print_usage(argv[0]);
      return VVPLAY_RET_FAIL;
    }

    if (!manifest_url && !local_dir)
    {
      logger::ERROR<Client>("Either --manifest=<url> or --local=<dir> is required");
      parser.print_usage(argv[0]);
      return VVPLAY_RET_FAIL;
    }

    components::client::TransportFactory factory;
    if (trace_path)
    {
      auto trace = std::make_shared<sim::NetworkTrace>(sim::NetworkTrace::load(*trace_path));
      factory    = [trace](boost::asio::io_context& ioc) -> fetch::SegmentTransportPtr
      {
        return std::make_unique<fetch::SimulatedTransport>(ioc, *trace,
                                                           fetch::SimulatedTransport::fromFiles());
      };
    }
    else if (manifest_url && utils::web::parseUrl(*manifest_url).isNetwork())
    {
      factory = [insecure](boost::asio::io_context& ioc) -> fetch::SegmentTransportPtr
      { return std::make_unique<fetch::HttpTransport>(ioc, !insecure); };
    }
    else
    {
      factory = [](boost::asio::io_context& ioc) -> fetch::SegmentTransportPtr
      { return std::make_unique<fetch::LocalFileTransport>(ioc); };
    }

    codec::SegmentDecoder             decoder;
    LoggingSink                       sink(fps);
    components::client::StreamSession session(cfg, factory, decoder, sink);

    // SIGINT / SIGTERM stop the session from a tiny side io_context
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait(
      [&session](const boost::system::error_code& ec, int signo)
      {
        if (ec)
          return;
        logger::WARN<Client>("Caught signal {}, stopping", signo);
        session.stop();
      });
    std::thread signal_thread([&signal_ioc]() { signal_ioc.run(); });

    auto join_signals = [&]()
    {
      signal_ioc.stop();
      signal_thread.join();
    };

    try
    {
      const auto manifest =
        local_dir ? manifest::Manifest::fromLocalFiles(listSegments(*local_dir), fps, per_segment)
                  : session.loadManifest(*manifest_url);
      session.play(manifest);
    }
    catch (const std::exception&)
    {
      join_signals();
      throw;
    }
    join_signals();

    std::cout << "Playback summary:\n"
              << playback::MetricsSerializer::toText(session.metrics()) << std::flush;
  }
  catch (const ManifestError& e)
  {
    logger::ERROR<Client>("Manifest rejected: {}", e.what());
    return VVPLAY_RET_FAIL;
  }
  catch (const ConfigError& e)
  {
    logger::ERROR<Client>("Configuration error: {}", e.what());
    return VVPLAY_RET_FAIL;
  }
  catch (const FetchError& e)
  {
    logger::ERROR<Client>("Network error: {}", e.what());
    return VVPLAY_RET_FAIL;
  }
  catch (const std::exception& e)
  {
    logger::ERROR<Client>("Fatal: {}", e.what());
    return VVPLAY_RET_FAIL;
  }

  logger::flush_logs();
  return VVPLAY_RET_SUC;
}
