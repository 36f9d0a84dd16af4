#pragma once

/**
 * @file jsonrpc.hpp
 * @brief Newline-delimited JSONRPC 2.0 messages over async byte streams.
 *
 * Every message is one line of UTF-8 JSON text terminated by @c "\n".  A
 * trailing @c "\r" is tolerated on input.  Reads operate on Boost.ASIO
 * @c posix::stream_descriptor objects and are designed to be used with
 * @c co_await in a coroutine context.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace mcpshim {

namespace json = boost::json;

// JSONRPC error codes produced locally
constexpr int PARSE_ERROR{-32700};
constexpr int INVALID_REQUEST{-32600};
constexpr int REQUEST_TIMEOUT{-32000};
constexpr int PROXY_UNREACHABLE{-32003};
constexpr int RATE_LIMITED{-32029};

/// A parsed request on its way to the proxy.
struct request {
  json::object message;
  // Set by the path sanitizer.  Such a request is answered locally and
  // never reaches the network.
  std::optional<std::string> violation{};

  [[nodiscard]] json::value id() const {
    if (auto* id = message.if_contains("id")) return *id;
    return nullptr;
  }
};

json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message);

/** @brief Read one line from @p stream.
 *
 * @p pending holds bytes read past the previous newline and must be kept
 * between calls.  Returns the line without its terminator, or an empty
 * optional once the stream reaches EOF with nothing left to return.
 *
 * At most @p max_line + 2 bytes (the line, a @c "\r" and the @c "\n") are
 * buffered.  A longer line comes back cut to that size, which is still
 * longer than @p max_line, and the rest of it is discarded.
 */
boost::asio::awaitable<std::optional<std::string>> read_jsonrpc_line(
    boost::asio::posix::stream_descriptor& stream, std::string& pending,
    std::size_t max_line = std::numeric_limits<std::size_t>::max());

/** @brief Write @p text followed by a newline to @p stream.
 *
 * The write is synchronous so that lines from concurrent handlers never
 * interleave.
 */
void write_jsonrpc_line(
    boost::asio::posix::stream_descriptor& stream, std::string_view text);

}  // namespace mcpshim
