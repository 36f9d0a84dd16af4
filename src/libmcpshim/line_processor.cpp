#include "mcpshim/line_processor.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/system/error_code.hpp>
#include <exception>

#include "logger.hpp"
#include "mcpshim/jsonrpc.hpp"
#include "utils.hpp"

namespace asio = boost::asio;

namespace mcpshim {

line_processor::line_processor(const config& cfg, forwarder& fwd, sink_t sink)
    : cfg_{&cfg},
      fwd_{&fwd},
      sanitizer_{cfg.allowed_paths},
      sink_{std::move(sink)} {}

void line_processor::submit(
    const asio::any_io_executor& executor, std::string line) {
  auto seq = next_in_++;
  asio::co_spawn(
      executor, handle(seq, std::move(line)), [](std::exception_ptr e) {
        if (e) std::rethrow_exception(e);
      });
}

asio::awaitable<json::object> line_processor::respond(std::string line) {
  LOG_DEBUG("Received request: {}", utils::preview(line));

  if (line.size() > cfg_->max_request_size) {
    LOG_WARN("Request line too large ({} bytes)", line.size());
    co_return make_jsonrpc_error(nullptr, INVALID_REQUEST, "Request too large");
  }

  boost::system::error_code ec;
  auto parsed = json::parse(line, ec);
  if (ec) {
    LOG_ERROR("Error processing request: {}", ec.message());
    co_return make_jsonrpc_error(
        nullptr, PARSE_ERROR, "Parse error: " + ec.message());
  }
  if (!parsed.is_object()) {
    LOG_ERROR("Error processing request: not a JSON object");
    co_return make_jsonrpc_error(
        nullptr, PARSE_ERROR, "Parse error: request is not a JSON object");
  }

  request req{std::move(parsed.get_object())};
  if (cfg_->is_filesystem_server()) sanitizer_.apply(req);

  co_return co_await fwd_->forward(std::move(req));
}

asio::awaitable<void> line_processor::handle(
    std::uint64_t seq, std::string line) {
  auto response = co_await respond(std::move(line));
  deliver(seq, json::serialize(response));
}

void line_processor::deliver(std::uint64_t seq, std::string text) {
  ready_.emplace(seq, std::move(text));
  for (auto it = ready_.begin(); it != ready_.end() && it->first == next_out_;
       it = ready_.erase(it)) {
    sink_(it->second);
    ++next_out_;
  }
}

}  // namespace mcpshim
