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

#include <utility> // std::exchange, needed by boost/asio/awaitable.hpp
#include <boost/asio.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

#include <libvvplay/common/error.hpp>
#include <libvvplay/common/macros.hpp>
#include <libvvplay/common/types.hpp>
#include <libvvplay/log-macros.hpp>
#include <libvvplay/utils/web/parser.hpp>

namespace ssl   = boost::asio::ssl;
namespace beast = boost::beast;
namespace http  = beast::http;
namespace asio  = boost::asio;
using tcp       = asio::ip::tcp;

using Network = libvvplay::log::NET;

namespace libvvplay::network
{

using PlainStream  = beast::tcp_stream;
using SecureStream = beast::ssl_stream<beast::tcp_stream>;

struct HttpResult
{
  unsigned      status = 0;
  SegmentBuffer body;
};

using HttpHandler = std::function<void(const boost::system::error_code&, HttpResult)>;

/*
 * One asynchronous HTTP(S) GET, from resolve to shutdown.
 *
 * The session keeps itself alive through shared_from_this() until the
 * handler has been invoked, exactly once. Every socket operation is bounded
 * by the same per-request deadline (beast's expires_at), the resolve step by
 * a steady_timer. Expiry surfaces as asio::error::timed_out.
 *
 * Non-2xx statuses are reported through the libvvplay::fetch error category:
 * 4xx as http_client_error and 5xx as http_server_error.
 *
 * Must be driven from a single thread running `ioc`.
 */
template <typename Stream>
class HttpGetSession : public std::enable_shared_from_this<HttpGetSession<Stream>>
{
  static constexpr bool IS_SECURE = std::is_same_v<Stream, SecureStream>;

public:
  template <typename S = Stream, std::enable_if_t<!std::is_same_v<S, SecureStream>, int> = 0>
  HttpGetSession(asio::io_context& ioc, utils::web::ParsedUrl target)
      : m_resolver(ioc), m_stream(ioc), m_resolveTimer(ioc), m_target(std::move(target))
  {
  }

  template <typename S = Stream, std::enable_if_t<std::is_same_v<S, SecureStream>, int> = 0>
  HttpGetSession(asio::io_context& ioc, ssl::context& ssl_ctx, utils::web::ParsedUrl target)
      : m_resolver(ioc), m_stream(ioc, ssl_ctx), m_resolveTimer(ioc), m_target(std::move(target))
  {
  }

  void run(std::chrono::milliseconds timeout, HttpHandler handler)
  {
    m_handler  = std::move(handler);
    m_deadline = SteadyClock::now() + timeout;

    if constexpr (IS_SECURE)
    {
      // SNI, most CDNs refuse the handshake without it
      if (!SSL_set_tlsext_host_name(m_stream.native_handle(), m_target.host.c_str()))
      {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        return finish(ec);
      }
      m_stream.set_verify_callback(ssl::host_name_verification(m_target.host));
    }

    m_resolveTimer.expires_at(m_deadline);
    m_resolveTimer.async_wait(
      [self = this->shared_from_this()](const beast::error_code& ec)
      {
        if (!ec)
        {
          self->m_timedOut = true;
          self->m_resolver.cancel();
        }
      });

    m_resolver.async_resolve(m_target.host, m_target.port,
                             [self = this->shared_from_this()](const beast::error_code& ec,
                                                               tcp::resolver::results_type results)
                             { self->onResolve(ec, std::move(results)); });
  }

  // Abandons the request, the handler receives operation_aborted
  void cancel()
  {
    m_cancelled = true;
    m_resolveTimer.cancel();
    m_resolver.cancel();
    beast::get_lowest_layer(m_stream).cancel();
  }

private:
  tcp::resolver                                              m_resolver;
  Stream                                                     m_stream;
  asio::steady_timer                                         m_resolveTimer;
  utils::web::ParsedUrl                                      m_target;
  beast::flat_buffer                                         m_buffer;
  http::request<http::empty_body>                            m_request;
  std::optional<http::response_parser<http::vector_body<ui8>>> m_parser;
  HttpHandler                                                m_handler;
  TimePoint                                                  m_deadline;
  bool                                                       m_timedOut  = false;
  bool                                                       m_cancelled = false;

  void onResolve(const beast::error_code& ec, tcp::resolver::results_type results)
  {
    m_resolveTimer.cancel();
    if (ec)
      return finish(ec);

    beast::get_lowest_layer(m_stream).expires_at(m_deadline);
    beast::get_lowest_layer(m_stream).async_connect(
      results, [self = this->shared_from_this()](const beast::error_code& ec,
                                                 const tcp::resolver::results_type::endpoint_type&)
      { self->onConnect(ec); });
  }

  void onConnect(const beast::error_code& ec)
  {
    if (ec)
      return finish(ec);

    if constexpr (IS_SECURE)
    {
      beast::get_lowest_layer(m_stream).expires_at(m_deadline);
      m_stream.async_handshake(ssl::stream_base::client,
                               [self = this->shared_from_this()](const beast::error_code& ec)
                               {
                                 if (ec)
                                   return self->finish(ec);
                                 self->sendRequest();
                               });
    }
    else
    {
      sendRequest();
    }
  }

  void sendRequest()
  {
    m_request.version(VVPLAY_HTTP_VERSION);
    m_request.method(http::verb::get);
    m_request.target(m_target.target);
    m_request.set(http::field::host, m_target.host);
    m_request.set(http::field::user_agent, macros::to_string(macros::USER_AGENT));
    m_request.set(http::field::accept, "*/*");

    beast::get_lowest_layer(m_stream).expires_at(m_deadline);
    http::async_write(m_stream, m_request,
                      [self = this->shared_from_this()](const beast::error_code& ec, std::size_t)
                      { self->onWrite(ec); });
  }

  void onWrite(const beast::error_code& ec)
  {
    if (ec)
      return finish(ec);

    m_parser.emplace();
    m_parser->body_limit(static_cast<std::uint64_t>(VVPLAY_MAX_SEGMENT_SIZE_MIBS) * 1024 * 1024);

    beast::get_lowest_layer(m_stream).expires_at(m_deadline);
    http::async_read(m_stream, m_buffer, *m_parser,
                     [self = this->shared_from_this()](const beast::error_code& ec, std::size_t)
                     { self->onRead(ec); });
  }

  void onRead(const beast::error_code& ec)
  {
    if (ec)
      return finish(ec);

    auto       response = m_parser->release();
    HttpResult result;
    result.status = response.result_int();
    result.body   = std::move(response.body());

    beast::error_code close_ec;
    if constexpr (IS_SECURE)
    {
      // A full TLS close_notify exchange is not worth another round trip here
      beast::get_lowest_layer(m_stream).socket().shutdown(tcp::socket::shutdown_both, close_ec);
    }
    else
    {
      m_stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);
    }
    if (close_ec && close_ec != beast::errc::not_connected)
      log::TRACE<Network>("Shutdown of {} reported: {}", m_target.host, close_ec.message());

    if (result.status >= 500)
      return finish(fetch::make_error_code(fetch::error::http_server_error), std::move(result));
    if (result.status >= 400)
      return finish(fetch::make_error_code(fetch::error::http_client_error), std::move(result));
    if (result.status < 200 || result.status >= 300)
      return finish(fetch::make_error_code(fetch::error::malformed_response), std::move(result));

    finish({}, std::move(result));
  }

  void finish(boost::system::error_code ec, HttpResult result = {})
  {
    if (!m_handler)
      return;

    if (m_cancelled)
      ec = asio::error::operation_aborted;
    else if (m_timedOut && ec == asio::error::operation_aborted)
      ec = asio::error::timed_out;

    auto handler = std::move(m_handler);
    m_handler    = nullptr;
    handler(ec, std::move(result));
  }
};

using PlainGetSession  = HttpGetSession<PlainStream>;
using SecureGetSession = HttpGetSession<SecureStream>;

} // namespace libvvplay::network
