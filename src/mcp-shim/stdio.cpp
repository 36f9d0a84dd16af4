#include "stdio.hpp"

#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>
#include <csignal>
#include <cstddef>
#include <exception>
#include <string>

#include "../libmcpshim/logger.hpp"
#include "mcpshim/forwarder.hpp"
#include "mcpshim/jsonrpc.hpp"
#include "mcpshim/line_processor.hpp"
#include "mcpshim/rate_limiter.hpp"
#include "mcpshim/response_cache.hpp"

namespace asio = boost::asio;
namespace sys = boost::system;

namespace mcpshim {

namespace {

asio::awaitable<void> read_loop(
    asio::posix::stream_descriptor& in, line_processor& processor,
    asio::signal_set& signals, std::size_t max_line) {
  auto executor{co_await asio::this_coro::executor};

  std::string pending{};
  while (auto line = co_await read_jsonrpc_line(in, pending, max_line)) {
    processor.submit(executor, std::move(*line));
  }

  LOG_INFO("stdin closed, {} response(s) outstanding", processor.pending());
  // Let the outstanding requests finish, then run() returns.
  signals.cancel();
}

}  // namespace

void run_stdio_server(const config& cfg) {
  asio::io_context ctx;

  response_cache cache{cfg};
  rate_limiter limiter{cfg};
  forwarder fwd{cfg, cache, limiter};

  // Duplicate stdin/stdout to allow async operations
  asio::posix::stream_descriptor in{ctx, ::dup(STDIN_FILENO)};
  asio::posix::stream_descriptor out{ctx, ::dup(STDOUT_FILENO)};

  line_processor processor{
    cfg, fwd, [&out](std::string_view text) { write_jsonrpc_line(out, text); }};

  asio::signal_set signals{ctx, SIGINT, SIGTERM};
  signals.async_wait([&ctx](const sys::error_code& ec, int signo) {
    if (ec) return;  // cancelled at EOF
    LOG_INFO("MCP Shim shutting down (signal {})", signo);
    ctx.stop();
  });

  asio::co_spawn(
      ctx, read_loop(in, processor, signals, cfg.max_request_size),
      [](std::exception_ptr e) {
        if (e) std::rethrow_exception(e);
      });
  ctx.run();
}

}  // namespace mcpshim
