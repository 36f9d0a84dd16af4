#include <doctest/doctest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_proxy.hpp"
#include "mcpshim/config.hpp"
#include "mcpshim/forwarder.hpp"
#include "mcpshim/jsonrpc.hpp"
#include "mcpshim/rate_limiter.hpp"
#include "mcpshim/response_cache.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
using mcpshim::test::fake_proxy;
using mcpshim::test::fake_reply;
using mcpshim::test::recorded_request;
using namespace std::chrono_literals;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* ok_body =
    R"({"jsonrpc":"2.0","id":1,"result":{"content":"hi"}})";

mcpshim::config fast_config(const std::string& proxy_url) {
  mcpshim::config cfg{};
  cfg.proxy_url = proxy_url;
  cfg.timeout = 2000ms;
  cfg.retry_initial_delay = 1ms;
  cfg.retry_max_delay = 5ms;
  return cfg;
}

mcpshim::request read_request(json::value id, std::string path = "/tmp/x") {
  json::object msg;
  msg["jsonrpc"] = "2.0";
  msg["id"] = std::move(id);
  msg["method"] = "tools/call";
  msg["params"] = json::object{
    {"name", "read_file"}, {"arguments", json::object{{"path", path.c_str()}}}};
  return mcpshim::request{std::move(msg)};
}

// Forward one request per io_context run.  The proxy keeps listening
// between runs and is shut down after the last one.
struct harness {
  asio::io_context ctx;
  fake_proxy proxy;
  mcpshim::config cfg;
  mcpshim::response_cache cache;
  mcpshim::rate_limiter limiter;
  mcpshim::forwarder fwd;

  explicit harness(
      fake_proxy::handler_t handler,
      const std::function<void(mcpshim::config&)>& tweak = {})
      : proxy{ctx, std::move(handler)},
        cfg{[&] {
          auto c = fast_config(proxy.url());
          if (tweak) tweak(c);
          return c;
        }()},
        cache{cfg},
        limiter{cfg},
        fwd{cfg, cache, limiter} {}

  json::object forward(mcpshim::request req, bool last = true) {
    auto res = mcpshim::test::run_to_completion(
        ctx, fwd.forward(std::move(req)), [&] {
          if (last)
            proxy.stop();
          else
            ctx.stop();
        });
    ctx.restart();
    return res;
  }
};

}  // namespace

TEST_CASE("forward-success-returns-proxy-body") {
  harness h{fake_proxy::always(ok_body)};
  auto res = h.forward(read_request(1));

  CHECK(json::serialize(res) == ok_body);
  REQUIRE(h.proxy.requests().size() == 1);
  const auto& seen = h.proxy.requests()[0];
  CHECK(seen.target == "/filesystem");
  CHECK(seen.content_type == "application/json");
  CHECK(seen.authorization.empty());
  CHECK(seen.json_body() == read_request(1).message);
}

TEST_CASE("forward-sends-bearer-token-and-base-path") {
  harness h{fake_proxy::always(ok_body), [](mcpshim::config& c) {
              c.api_key = "s3cret";
              c.proxy_url += "/mcp/";
              c.server_name = "memory";
            }};
  h.forward(read_request(1));

  REQUIRE(h.proxy.requests().size() == 1);
  CHECK(h.proxy.requests()[0].authorization == "Bearer s3cret");
  CHECK(h.proxy.requests()[0].target == "/mcp/memory");
  CHECK(h.fwd.target() == "/mcp/memory");
}

TEST_CASE("forward-serves-repeat-from-cache") {
  harness h{fake_proxy::always(ok_body)};
  h.forward(read_request(1), false);
  auto second = h.forward(read_request("two"));

  CHECK(h.proxy.requests().size() == 1);
  CHECK(second.at("id").as_string() == "two");
  CHECK(second.at("result").at("content").as_string() == "hi");
  // a cache hit still counts against the rate limit
  CHECK(h.limiter.in_window() == 2);
}

TEST_CASE("forward-does-not-cache-errors-or-mutations") {
  SUBCASE("error response") {
    harness h{fake_proxy::always(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"nope"}})")};
    h.forward(read_request(1), false);
    auto second = h.forward(read_request(2));
    CHECK(h.proxy.requests().size() == 2);
    CHECK(second.at("error").at("code").as_int64() == -32601);
    CHECK(h.cache.size() == 0);
  }
  SUBCASE("write_file") {
    harness h{fake_proxy::always(ok_body)};
    auto write = read_request(1);
    write.message["params"].as_object()["name"] = "write_file";
    h.forward(write, false);
    h.forward(write);
    CHECK(h.proxy.requests().size() == 2);
    CHECK(h.cache.size() == 0);
  }
}

TEST_CASE("forward-retries-then-gives-up") {
  harness h{
    [](const recorded_request&) {
      return fake_reply{500, "boom"};
    },
    [](mcpshim::config& c) { c.max_retries = 2; }};
  auto res = h.forward(read_request(42));

  CHECK(h.proxy.requests().size() == 3);
  CHECK(h.fwd.attempts() == 3);
  CHECK(res.at("id").as_int64() == 42);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::PROXY_UNREACHABLE);
  CHECK(
      res.at("error").at("message").as_string() ==
      "Failed to communicate with MCP proxy: HTTP error 500: boom");
}

TEST_CASE("forward-recovers-after-transient-failures") {
  int calls{0};
  harness h{[&](const recorded_request&) {
    if (++calls < 3) return fake_reply{503, "busy"};
    return fake_reply{200, ok_body};
  }};
  auto res = h.forward(read_request(1));

  CHECK(h.proxy.requests().size() == 3);
  CHECK(res.contains("result"));
  CHECK(h.cache.size() == 1);
}

TEST_CASE("forward-retries-unparseable-body") {
  harness h{
    fake_proxy::always("this is not json"),
    [](mcpshim::config& c) { c.max_retries = 1; }};
  auto res = h.forward(read_request(1));

  CHECK(h.proxy.requests().size() == 2);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::PROXY_UNREACHABLE);
}

TEST_CASE("forward-timeout-is-not-retried") {
  harness h{
    [](const recorded_request&) {
      return fake_reply{200, ok_body, 300ms};
    },
    [](mcpshim::config& c) {
      c.timeout = 50ms;
      c.max_retries = 3;
    }};
  auto res = h.forward(read_request(5));

  CHECK(h.proxy.requests().size() == 1);
  CHECK(h.fwd.attempts() == 1);
  CHECK(res.at("id").as_int64() == 5);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::REQUEST_TIMEOUT);
  CHECK(
      res.at("error").at("message").as_string() ==
      "Request timed out after 50ms");
}

TEST_CASE("forward-unreachable-proxy") {
  asio::io_context ctx;
  auto cfg = fast_config(
      "http://127.0.0.1:" + std::to_string(mcpshim::test::unused_port()));
  cfg.max_retries = 2;
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  mcpshim::forwarder fwd{cfg, cache, limiter};

  auto res =
      mcpshim::test::run_to_completion(ctx, fwd.forward(read_request("r")));

  CHECK(fwd.attempts() == 3);
  CHECK(res.at("id").as_string() == "r");
  CHECK(res.at("error").at("code").as_int64() == mcpshim::PROXY_UNREACHABLE);
}

TEST_CASE("forward-connect-stall-times-out-without-retry") {
  asio::io_context ctx;

  // A listener that never accepts, with its zero backlog already taken:
  // further SYNs are dropped, and anything that does get queued is never
  // read.
  tcp::acceptor stalled{ctx};
  stalled.open(tcp::v4());
  stalled.bind(tcp::endpoint{asio::ip::address_v4::loopback(), 0});
  stalled.listen(0);
  const auto endpoint = stalled.local_endpoint();
  tcp::socket queued{ctx};
  queued.connect(endpoint);
  std::this_thread::sleep_for(50ms);
  std::vector<tcp::socket> waiting;
  waiting.reserve(3);
  for (int i = 0; i < 3; ++i) {
    waiting.emplace_back(ctx);
    waiting.back().async_connect(endpoint, [](const auto&) {});
  }

  auto cfg =
      fast_config("http://127.0.0.1:" + std::to_string(endpoint.port()));
  cfg.timeout = 100ms;
  cfg.max_retries = 3;
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  mcpshim::forwarder fwd{cfg, cache, limiter};

  auto started = std::chrono::steady_clock::now();
  auto res = mcpshim::test::run_to_completion(
      ctx, fwd.forward(read_request(9)), [&] {
        for (auto& s : waiting) s.close();
        stalled.close();
      });
  auto elapsed = std::chrono::steady_clock::now() - started;

  CHECK(fwd.attempts() == 1);
  CHECK(elapsed < 2s);
  CHECK(res.at("id").as_int64() == 9);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::REQUEST_TIMEOUT);
  CHECK(
      res.at("error").at("message").as_string() ==
      "Request timed out after 100ms");
}

TEST_CASE("forward-deadline-covers-name-resolution") {
  // With the budget spent before the lookup, the attempt must end as a
  // timeout rather than a retried resolver failure.
  asio::io_context ctx;
  auto cfg = fast_config("http://proxy.invalid");
  cfg.timeout = 0ms;
  cfg.max_retries = 3;
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  mcpshim::forwarder fwd{cfg, cache, limiter};

  auto res =
      mcpshim::test::run_to_completion(ctx, fwd.forward(read_request(4)));

  CHECK(fwd.attempts() == 1);
  CHECK(res.at("id").as_int64() == 4);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::REQUEST_TIMEOUT);
}

TEST_CASE("forward-https-speaks-tls") {
  // The fake proxy only speaks plain HTTP, so the TLS handshake fails and
  // no request is ever parsed on its side.
  harness h{fake_proxy::always(ok_body), [](mcpshim::config& c) {
              c.proxy_url.replace(0, 4, "https");
              c.max_retries = 1;
            }};
  auto res = h.forward(read_request(3));

  CHECK(h.fwd.attempts() == 2);
  CHECK(h.proxy.requests().empty());
  CHECK(res.at("id").as_int64() == 3);
  CHECK(res.at("error").at("code").as_int64() == mcpshim::PROXY_UNREACHABLE);
}

TEST_CASE("forward-local-rejections-skip-the-network") {
  SUBCASE("security violation") {
    harness h{fake_proxy::always(ok_body)};
    auto req = read_request(1);
    req.violation = "Access denied to path: /etc";
    auto res = h.forward(req);

    CHECK(h.proxy.requests().empty());
    CHECK(h.limiter.in_window() == 0);
    CHECK(
        json::serialize(res) ==
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32600,"message":"Access denied to path: /etc"}})");
  }
  SUBCASE("oversize") {
    harness h{fake_proxy::always(ok_body), [](mcpshim::config& c) {
                c.max_request_size = 16;
              }};
    auto req = read_request(1);
    auto size = json::serialize(req.message).size();
    auto res = h.forward(req);

    CHECK(h.proxy.requests().empty());
    CHECK(h.limiter.in_window() == 0);
    CHECK(res.at("error").at("code").as_int64() == mcpshim::INVALID_REQUEST);
    CHECK(
        res.at("error").at("message").as_string() ==
        "Request too large (" + std::to_string(size) + " bytes)");
  }
  SUBCASE("rate limit") {
    harness h{fake_proxy::always(ok_body), [](mcpshim::config& c) {
                c.rate_limit_per_minute = 1;
              }};
    h.forward(read_request(1, "/tmp/a"), false);
    auto res = h.forward(read_request(2, "/tmp/b"));

    CHECK(h.proxy.requests().size() == 1);
    CHECK(h.limiter.in_window() == 1);
    CHECK(res.at("id").as_int64() == 2);
    CHECK(res.at("error").at("code").as_int64() == mcpshim::RATE_LIMITED);
    CHECK(res.at("error").at("message").as_string() == "Rate limit exceeded");
  }
}

TEST_CASE("backoff-delay-is-capped-and-jittered") {
  mcpshim::config cfg{};
  cfg.retry_initial_delay = 100ms;
  cfg.retry_max_delay = 5000ms;
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  mcpshim::forwarder fwd{cfg, cache, limiter};

  for (int i = 0; i < 50; ++i) {
    auto d0 = fwd.backoff_delay(0).count();
    CHECK(d0 >= 90);
    CHECK(d0 <= 110);
    auto d2 = fwd.backoff_delay(2).count();
    CHECK(d2 >= 360);
    CHECK(d2 <= 440);
    CHECK(fwd.backoff_delay(10).count() == 5000);
  }
}

TEST_CASE("backoff-delay-survives-extreme-inputs") {
  mcpshim::config cfg{};
  cfg.retry_initial_delay = 0ms;
  cfg.retry_max_delay = 5000ms;
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  mcpshim::forwarder fwd{cfg, cache, limiter};
  CHECK(fwd.backoff_delay(0).count() == 0);
  CHECK(fwd.backoff_delay(2000).count() == 0);

  cfg.retry_initial_delay = 100ms;
  CHECK(fwd.backoff_delay(2000).count() == 5000);
  CHECK(fwd.backoff_delay(1'000'000).count() == 5000);
}

TEST_CASE("forwarder-rejects-bad-proxy-url") {
  mcpshim::config cfg{};
  cfg.proxy_url = "ftp://example.com";
  mcpshim::response_cache cache{cfg};
  mcpshim::rate_limiter limiter{cfg};
  CHECK_THROWS_AS(
      mcpshim::forwarder(cfg, cache, limiter), std::runtime_error);
}
