// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <type_traits>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/io_context.hpp>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <boost/core/noncopyable.hpp>

#include "http_backend.h"
#include "geocoder/error.h"
#include "utils/log.h"

namespace geodist::geocoder
{

namespace asio = boost::asio;
namespace web = boost::beast;
namespace http = web::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace // detail
{
  /**
   * Geocoding requests are bodyless GETs, all the
   * input is carried in the query string.
   */
  using request_type = http::request<http::empty_body>;
  using response_type = http::response<http::string_body>;

  using plain_stream_t = web::tcp_stream;
  using tls_stream_t = web::ssl_stream<web::tcp_stream>;

  std::string host_header(net::uri const& endpoint)
  {
    bool default_port =
      (endpoint.proto() == net::uri::protocol::https && endpoint.port() == 443) ||
      (endpoint.proto() == net::uri::protocol::http && endpoint.port() == 80);

    if (default_port) {
      return endpoint.host();
    }
    return endpoint.host() + ":" + std::to_string(endpoint.port());
  }
}

/**
 * This class represents one asynchronous
 * connect->handshake->write->read chain against the provider.
 *
 * It does not own the stream or the io_context that drives it. Whoever
 * runs the io_context inspects done() and error() once it returns. Every
 * step shares the same absolute deadline through the stream's expiry.
 * Names are resolved before the chain starts, the io_context never owns
 * a resolver whose worker thread its destructor would have to join.
 */
template <typename Stream>
class exchange : private boost::noncopyable
{
public:
  exchange(Stream& stream, endpoints_t endpoints,
           request_type request, deadline_t deadline)
    : stream_(stream)
    , endpoints_(std::move(endpoints))
    , request_(std::move(request))
    , deadline_(deadline)
  {
  }

public:
  void start() { do_connect(); }

  bool done() const { return done_; }
  const char* stage() const { return stage_; }
  web::error_code const& error() const { return error_; }
  response_type& response() { return response_; }

private:
  void do_connect()
  {
    auto& layer = web::get_lowest_layer(stream_);
    layer.expires_at(deadline_);
    layer.async_connect(endpoints_,
      [this](web::error_code ec, tcp::endpoint const&) {
        if (ec) {
          return finish(ec, "connect");
        }
        do_handshake();
      });
  }

  void do_handshake()
  {
    if constexpr (std::is_same_v<Stream, plain_stream_t>) {
      do_write();
    } else {
      stream_.async_handshake(ssl::stream_base::client,
        [this](web::error_code ec) {
          if (ec) {
            return finish(ec, "tls handshake");
          }
          do_write();
        });
    }
  }

  void do_write()
  {
    http::async_write(stream_, request_,
      [this](web::error_code ec, size_t) {
        if (ec) {
          return finish(ec, "write");
        }
        do_read();
      });
  }

  void do_read()
  {
    http::async_read(stream_, buffer_, response_,
      [this](web::error_code ec, size_t) {
        finish(ec, "read");
      });
  }

  void finish(web::error_code ec, const char* stage)
  {
    error_ = ec;
    stage_ = stage;
    done_ = true;
  }

private:
  Stream& stream_;
  endpoints_t endpoints_;
  request_type request_;
  deadline_t deadline_;
  web::flat_buffer buffer_;
  response_type response_;
  web::error_code error_;
  const char* stage_ = "";
  bool done_ = false;
};

template <typename Stream>
std::string perform(
  asio::io_context& ioctx, Stream& stream,
  net::uri const& endpoint, endpoints_t endpoints,
  request_type request, deadline_t deadline,
  std::stop_token const& stop)
{
  exchange<Stream> xchg(stream, std::move(endpoints),
    std::move(request), deadline);

  // a stop request only needs to get run_until() to return, pending
  // operations are torn down along with the stream and the io_context.
  std::stop_callback on_stop(stop, [&ioctx] { ioctx.stop(); });

  xchg.start();
  ioctx.run_until(deadline);

  if (!xchg.done()) {
    if (stop.stop_requested()) {
      throw cancelled_error("lookup against " + endpoint.host() + " cancelled");
    }
    throw timeout_error("no response from " + endpoint.host() +
                        " before the deadline");
  }

  if (xchg.error()) {
    if (xchg.error() == web::error::timeout) {
      throw timeout_error(std::string(xchg.stage()) + " timed out for " +
                          endpoint.host());
    }
    throw transport_error(std::string(xchg.stage()) + " failed for " +
                          endpoint.host() + ": " + xchg.error().message());
  }

  auto& response = xchg.response();
  dbglog << "provider responded with http " << response.result_int();

  if (response.result_int() < 200 || response.result_int() >= 300) {
    throw transport_error("provider responded with http " +
                          std::to_string(response.result_int()));
  }

  return std::move(response.body());
}

http_backend::http_backend(config const& cfg, resolve_fn resolve)
  : endpoint_(cfg.endpoint)
  , user_agent_(cfg.user_agent)
  , resolve_(std::move(resolve))
{
}

std::string http_backend::fetch(
  std::string const& target,
  deadline_t deadline,
  std::stop_token stop) const
{
  if (stop.stop_requested()) {
    throw cancelled_error();
  }

  request_type request{http::verb::get, target, 11};
  request.set(http::field::host, host_header(endpoint_));
  request.set(http::field::user_agent, user_agent_);
  request.set(http::field::accept, "application/json");

  auto endpoints = resolve_until(resolve_, endpoint_.host(),
    std::to_string(endpoint_.port()), deadline, stop);

  asio::io_context ioctx;

  if (endpoint_.proto() == net::uri::protocol::http) {
    plain_stream_t stream(ioctx);
    return perform(ioctx, stream, endpoint_, std::move(endpoints),
      std::move(request), deadline, stop);
  }

  ssl::context tls(ssl::context::tls_client);
  try {
    tls.set_default_verify_paths();
    tls.set_verify_mode(ssl::verify_peer);
  } catch (boost::system::system_error const& e) {
    throw transport_error(std::string("tls setup failed: ") + e.what());
  }

  tls_stream_t stream(ioctx, tls);

  // SNI, most providers sit behind shared frontends
  // and will not complete the handshake without it.
  if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                endpoint_.host().c_str())) {
    web::error_code ec(static_cast<int>(::ERR_get_error()),
                       asio::error::get_ssl_category());
    throw transport_error("failed to set tls server name: " + ec.message());
  }
  stream.set_verify_callback(ssl::host_name_verification(endpoint_.host()));

  return perform(ioctx, stream, endpoint_, std::move(endpoints),
    std::move(request), deadline, stop);
}

}
