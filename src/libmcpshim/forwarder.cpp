#include "mcpshim/forwarder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <cmath>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "mcpshim/http_client.hpp"
#include "utils.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace sys = boost::system;

namespace mcpshim {

forwarder::forwarder(
    const config& cfg, response_cache& cache, rate_limiter& limiter)
    : cfg_{&cfg},
      cache_{&cache},
      limiter_{&limiter},
      url_{parse_proxy_url(cfg.proxy_url)},
      target_{url_.base_path + "/" + cfg.server_name},
      rng_{std::random_device{}()} {}

millis forwarder::backoff_delay(int attempt) {
  // Keeps the product finite; the cap bites long before 2^62
  constexpr int max_exponent{62};
  std::uniform_real_distribution<double> jitter{0.9, 1.1};
  double delay = static_cast<double>(cfg_->retry_initial_delay.count()) *
                 std::pow(2.0, std::clamp(attempt, 0, max_exponent)) *
                 jitter(rng_);
  delay = std::min(delay, static_cast<double>(cfg_->retry_max_delay.count()));
  return millis{static_cast<millis::rep>(delay)};
}

asio::awaitable<json::object> forwarder::forward(request req) {
  auto id = req.id();

  if (req.violation)
    co_return make_jsonrpc_error(id, INVALID_REQUEST, *req.violation);

  auto body = json::serialize(req.message);
  if (body.size() > cfg_->max_request_size) {
    LOG_WARN(
        "Request size ({} bytes) exceeds maximum ({} bytes)", body.size(),
        cfg_->max_request_size);
    co_return make_jsonrpc_error(
        id, INVALID_REQUEST,
        fmt::format("Request too large ({} bytes)", body.size()));
  }

  if (limiter_->would_exceed()) {
    LOG_WARN(
        "Rate limit exceeded: {} requests per minute",
        cfg_->rate_limit_per_minute);
    co_return make_jsonrpc_error(id, RATE_LIMITED, "Rate limit exceeded");
  }
  limiter_->record();

  auto cache_key = response_cache::key(req.message);
  if (cache_key) {
    if (auto hit = cache_->get(*cache_key, id)) co_return std::move(*hit);
  }

  LOG_DEBUG(
      "Forwarding {} (id {}) to {}:{}{}",
      string_or(req.message, "method", "?"), json::serialize(id), url_.host,
      url_.port, target_);

  const int total = cfg_->max_retries + 1;
  std::string last_error{"Unknown error"};
  for (int attempt = 0; attempt < total; ++attempt) {
    bool timed_out{false};
    try {
      ++attempts_;
      auto reply = co_await http_post(
          url_, target_, body, cfg_->api_key, cfg_->timeout);
      if (reply.status < 200 || reply.status >= 300)
        utils::throwf("HTTP error {}: {}", reply.status, reply.body);

      auto parsed = json::parse(reply.body);
      auto* response = parsed.if_object();
      if (!response) utils::throwf("Proxy response is not a JSON object");

      LOG_DEBUG(
          "Response from proxy for id {}: {}", json::serialize(id),
          response->contains("error") ? "error" : "success");

      if (cache_key && !response->contains("error"))
        cache_->put(*cache_key, *response);
      co_return std::move(*response);
    } catch (const sys::system_error& e) {
      timed_out = e.code() == beast::error::timeout;
      last_error = e.code().message();
    } catch (const std::exception& e) {
      last_error = e.what();
    }

    if (timed_out) {
      LOG_ERROR("Request timed out after {}ms", cfg_->timeout.count());
      co_return make_jsonrpc_error(
          id, REQUEST_TIMEOUT,
          fmt::format("Request timed out after {}ms", cfg_->timeout.count()));
    }

    if (attempt + 1 >= total) break;

    auto delay = backoff_delay(attempt);
    LOG_WARN(
        "Request failed (attempt {}/{}). Retrying in {}ms: {}", attempt + 1,
        total, delay.count(), last_error);
    asio::steady_timer timer{co_await asio::this_coro::executor, delay};
    co_await timer.async_wait(asio::use_awaitable);
  }

  LOG_ERROR("Request failed after {} attempts: {}", total, last_error);
  co_return make_jsonrpc_error(
      id, PROXY_UNREACHABLE,
      fmt::format("Failed to communicate with MCP proxy: {}", last_error));
}

}  // namespace mcpshim
