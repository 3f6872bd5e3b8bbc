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

#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <filesystem>
#include <fstream>
#include <libvvplay/common/error.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/tsfetcher/methods/local/entry.hpp>
#include <libvvplay/utils/web/parser.hpp>

namespace fs   = std::filesystem;
namespace asio = boost::asio;

namespace libvvplay::fetch
{

auto LocalFileTransport::readFile(const AbsPath& path) -> SegmentBuffer
{
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw FetchError("Cannot open '" + path + "'");

  std::error_code ec;
  const auto      size = fs::file_size(path, ec);
  if (ec)
    throw FetchError("Cannot stat '" + path + "': " + ec.message());

  SegmentBuffer data(size);
  if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size)))
    throw FetchError("Short read on '" + path + "'");
  return data;
}

void LocalFileTransport::asyncGet(const Url& url, std::chrono::milliseconds,
                                  TransferHandler handler)
{
  AbsPath path;
  try
  {
    path = utils::web::localPathOf(url);
  }
  catch (const std::invalid_argument& e)
  {
    log::ERROR<log::FETCH>("{}", e.what());
    asio::post(m_ioc, [handler = std::move(handler)]()
               { handler(asio::error::invalid_argument, {}); });
    return;
  }

  asio::post(m_ioc,
             [this, generation = m_generation, path = std::move(path),
              handler = std::move(handler)]()
             {
               if (generation != m_generation)
                 return handler(asio::error::operation_aborted, {});

               const auto     start = SteadyClock::now();
               TransferResult result;
               try
               {
                 result.body = readFile(path);
               }
               catch (const FetchError& e)
               {
                 log::ERROR<log::FETCH>("{}", e.what());
                 return handler(
                   boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory),
                   {});
               }
               result.elapsed = SteadyClock::now() - start;
               handler({}, std::move(result));
             });
}

} // namespace libvvplay::fetch
