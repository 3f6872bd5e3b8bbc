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
#include <libvvplay/network/entry.hpp>
#include <libvvplay/tsfetcher/methods/http/entry.hpp>

namespace libvvplay::fetch
{

HttpTransport::HttpTransport(asio::io_context& ioc, bool verify_peer)
    : m_ioc(ioc), m_sslCtx(ssl::context::tls_client)
{
  if (verify_peer)
  {
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(ssl::verify_peer);
  }
  else
  {
    log::WARN<Network>("TLS peer verification is disabled");
    m_sslCtx.set_verify_mode(ssl::verify_none);
  }
}

void HttpTransport::asyncGet(const Url& url, std::chrono::milliseconds timeout,
                             TransferHandler handler)
{
  utils::web::ParsedUrl target;
  try
  {
    target = utils::web::parseUrl(url);
  }
  catch (const std::invalid_argument& e)
  {
    log::ERROR<Network>("Bad URL '{}': {}", url, e.what());
    asio::post(m_ioc, [handler = std::move(handler)]()
               { handler(asio::error::invalid_argument, {}); });
    return;
  }

  if (!target.isNetwork())
  {
    log::ERROR<Network>("'{}' is not an http(s) URL", url);
    asio::post(m_ioc, [handler = std::move(handler)]()
               { handler(asio::error::invalid_argument, {}); });
    return;
  }

  const auto id    = m_nextId++;
  const auto start = SteadyClock::now();

  auto on_done = [this, id, start, handler = std::move(handler)](
                   const boost::system::error_code& ec, network::HttpResult result)
  {
    m_live.erase(id);

    TransferResult transfer;
    transfer.elapsed = SteadyClock::now() - start;
    transfer.status  = result.status;
    transfer.body    = std::move(result.body);

    if (ec && ec != asio::error::operation_aborted)
      log::DBG<Network>("GET failed ({}): {}", transfer.status, ec.message());

    handler(ec, std::move(transfer));
  };

  log::TRACE<Network>("GET {}://{}:{}{}", target.scheme, target.host, target.port, target.target);

  if (target.isSecure())
  {
    auto session = std::make_shared<network::SecureGetSession>(m_ioc, m_sslCtx, std::move(target));
    m_live[id]   = [weak = std::weak_ptr<network::SecureGetSession>(session)]()
    {
      if (auto s = weak.lock())
        s->cancel();
    };
    session->run(timeout, std::move(on_done));
  }
  else
  {
    auto session = std::make_shared<network::PlainGetSession>(m_ioc, std::move(target));
    m_live[id]   = [weak = std::weak_ptr<network::PlainGetSession>(session)]()
    {
      if (auto s = weak.lock())
        s->cancel();
    };
    session->run(timeout, std::move(on_done));
  }
}

void HttpTransport::cancelAll()
{
  auto live = std::move(m_live);
  m_live.clear();
  for (auto& [id, cancel] : live)
    cancel();
}

} // namespace libvvplay::fetch
