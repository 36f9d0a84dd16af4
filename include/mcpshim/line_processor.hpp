#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "mcpshim/config.hpp"
#include "mcpshim/forwarder.hpp"
#include "mcpshim/path_sanitizer.hpp"

namespace mcpshim {

/// Turns input lines into response lines.
///
/// Each submitted line is handled in its own coroutine, so a slow proxy
/// call doesn't hold up the lines behind it.  Responses still leave in
/// input order: a finished response waits until all earlier ones have been
/// written.
class line_processor {
 public:
  using sink_t = std::function<void(std::string_view)>;

  line_processor(const config& cfg, forwarder& fwd, sink_t sink);

  line_processor(const line_processor&) = delete;
  line_processor& operator=(const line_processor&) = delete;

  /// Start handling @p line on @p executor.  Exceptions escaping a handler
  /// are rethrown out of the executor's run().
  void submit(const boost::asio::any_io_executor& executor, std::string line);

  /// The response for a single line, without any ordering.
  boost::asio::awaitable<json::object> respond(std::string line);

  /// Lines submitted whose response hasn't been written yet.
  [[nodiscard]] std::size_t pending() const { return next_in_ - next_out_; }

 private:
  boost::asio::awaitable<void> handle(std::uint64_t seq, std::string line);
  void deliver(std::uint64_t seq, std::string text);

  const config* cfg_;
  forwarder* fwd_;
  path_sanitizer sanitizer_;
  sink_t sink_;
  std::uint64_t next_in_{0};
  std::uint64_t next_out_{0};
  std::map<std::uint64_t, std::string> ready_;
};

}  // namespace mcpshim
