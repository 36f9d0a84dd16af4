#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <random>
#include <string>

#include "mcpshim/config.hpp"
#include "mcpshim/jsonrpc.hpp"
#include "mcpshim/rate_limiter.hpp"
#include "mcpshim/response_cache.hpp"

namespace mcpshim {

/// Sends requests to "<proxy_url>/<server_name>" and turns every outcome
/// into a JSONRPC response.
///
/// Per request: security violation, size and rate checks first, then the
/// cache, then up to max_retries + 1 HTTP attempts with capped exponential
/// backoff.  A timed out attempt is not retried.
class forwarder {
 public:
  // Throws std::runtime_error if cfg.proxy_url is not a usable URL.
  forwarder(const config& cfg, response_cache& cache, rate_limiter& limiter);

  forwarder(const forwarder&) = delete;
  forwarder& operator=(const forwarder&) = delete;

  /// Never throws for a request-level failure; those become error
  /// responses carrying the request's id.
  boost::asio::awaitable<json::object> forward(request req);

  /// min(max_delay, initial_delay * 2^attempt * U(0.9, 1.1))
  millis backoff_delay(int attempt);

  /// HTTP attempts made so far, over all requests.
  [[nodiscard]] std::size_t attempts() const { return attempts_; }

  [[nodiscard]] const std::string& target() const { return target_; }

 private:
  const config* cfg_;
  response_cache* cache_;
  rate_limiter* limiter_;
  proxy_url url_;
  std::string target_;
  std::mt19937 rng_;
  std::size_t attempts_{0};
};

}  // namespace mcpshim
