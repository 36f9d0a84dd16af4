#include "mcpshim/http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <limits>
#include <memory>
#include <optional>

#include "logger.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
namespace sys = boost::system;
using tcp = asio::ip::tcp;

namespace mcpshim {

namespace {

using clock_type = std::chrono::steady_clock;

[[noreturn]] void throw_timeout() {
  throw sys::system_error{beast::error_code{beast::error::timeout}};
}

struct pending_resolve {
  explicit pending_resolve(const asio::any_io_executor& executor)
      : resolver{executor}, wake{executor} {}

  tcp::resolver resolver;
  asio::steady_timer wake;
  std::optional<sys::error_code> ec{};
  tcp::resolver::results_type results{};
};

// getaddrinfo() can't be interrupted.  Past the deadline the lookup is
// abandoned: its handler still runs later and owns the shared state.
asio::awaitable<tcp::resolver::results_type> resolve_until(
    const proxy_url& url, clock_type::time_point deadline) {
  if (clock_type::now() >= deadline) throw_timeout();

  auto state =
      std::make_shared<pending_resolve>(co_await asio::this_coro::executor);
  state->wake.expires_at(deadline);
  state->resolver.async_resolve(
      url.host, url.port,
      [state](const sys::error_code& ec, tcp::resolver::results_type results) {
        state->ec = ec;
        state->results = std::move(results);
        state->wake.cancel();
      });

  sys::error_code ignored;
  co_await state->wake.async_wait(
      asio::redirect_error(asio::use_awaitable, ignored));

  if (!state->ec) {
    LOG_DEBUG("Resolving {} outlived the attempt deadline", url.host);
    state->resolver.cancel();
    throw_timeout();
  }
  if (*state->ec) throw sys::system_error{*state->ec};
  co_return state->results;
}

ssl::context& tls_context() {
  static ssl::context ctx = [] {
    ssl::context c{ssl::context::tls_client};
    c.set_default_verify_paths();
    c.set_verify_mode(ssl::verify_peer);
    return c;
  }();
  return ctx;
}

http::request<http::string_body> make_request(
    const proxy_url& url, const std::string& target, const std::string& body,
    const std::string& api_key) {
  http::request<http::string_body> req{http::verb::post, target, 11};
  req.set(
      http::field::host,
      url.port == url.default_port() ? url.host : url.host + ":" + url.port);
  req.set(http::field::user_agent, "mcp-shim/0.1");
  req.set(http::field::content_type, "application/json");
  if (!api_key.empty())
    req.set(http::field::authorization, "Bearer " + api_key);
  req.keep_alive(false);
  req.body() = body;
  req.prepare_payload();
  return req;
}

template <typename Stream>
asio::awaitable<http_reply> exchange(
    Stream& stream, http::request<http::string_body> req) {
  co_await http::async_write(stream, req, asio::use_awaitable);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  co_await http::async_read(stream, buffer, parser, asio::use_awaitable);

  auto res = parser.release();
  co_return http_reply{res.result_int(), std::move(res.body())};
}

}  // namespace

asio::awaitable<http_reply> http_post(
    const proxy_url& url, const std::string& target, const std::string& body,
    const std::string& api_key, millis timeout) {
  auto executor = co_await asio::this_coro::executor;
  const auto deadline = clock_type::now() + timeout;

  auto endpoints = co_await resolve_until(url, deadline);
  auto req = make_request(url, target, body, api_key);

  if (!url.is_tls()) {
    beast::tcp_stream stream{executor};
    stream.expires_at(deadline);
    co_await stream.async_connect(endpoints, asio::use_awaitable);
    auto reply = co_await exchange(stream, std::move(req));
    LOG_TRACE("POST {} -> {}", target, reply.status);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return reply;
  }

  beast::ssl_stream<beast::tcp_stream> stream{executor, tls_context()};
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
    throw sys::system_error{beast::error_code{
      static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()}};
  stream.set_verify_callback(ssl::host_name_verification(url.host));

  beast::get_lowest_layer(stream).expires_at(deadline);
  co_await beast::get_lowest_layer(stream).async_connect(
      endpoints, asio::use_awaitable);
  co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);
  auto reply = co_await exchange(stream, std::move(req));
  LOG_TRACE("POST {} (TLS) -> {}", target, reply.status);

  // Peers often close without a close_notify; nothing is lost by then
  beast::error_code ec;
  co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
  co_return reply;
}

}  // namespace mcpshim
