#include "mcpshim/jsonrpc.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <array>
#include <limits>

namespace mcpshim {

namespace asio = boost::asio;
namespace sys = boost::system;

namespace {

std::string strip_cr(std::string line) {
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

}  // namespace

json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

asio::awaitable<std::optional<std::string>> read_jsonrpc_line(
    asio::posix::stream_descriptor& stream, std::string& pending,
    std::size_t max_line) {
  // Room for the line, a '\r' and the '\n'
  constexpr auto unbounded = std::numeric_limits<std::size_t>::max();
  const auto limit = max_line <= unbounded - 2 ? max_line + 2 : unbounded;

  sys::error_code ec;
  auto n = co_await asio::async_read_until(
      stream, asio::dynamic_buffer(pending, limit), '\n',
      asio::redirect_error(asio::use_awaitable, ec));

  if (ec == asio::error::not_found) {
    // Hand out what fits so the caller rejects the line, and drop the
    // rest of it.
    std::string oversized{std::move(pending)};
    pending.clear();
    for (;;) {
      n = co_await asio::async_read_until(
          stream, asio::dynamic_buffer(pending, limit), '\n',
          asio::redirect_error(asio::use_awaitable, ec));
      if (!ec) {
        pending.erase(0, n);
        break;
      }
      pending.clear();
      if (ec == asio::error::eof) break;
      if (ec != asio::error::not_found) throw sys::system_error{ec};
    }
    co_return oversized;
  }

  if (ec == asio::error::eof) {
    // Hand out an unterminated last line, if any
    if (pending.empty()) co_return std::nullopt;
    std::string last{std::move(pending)};
    pending.clear();
    co_return strip_cr(std::move(last));
  }
  if (ec) throw sys::system_error{ec};

  std::string line{pending.substr(0, n - 1)};
  pending.erase(0, n);
  co_return strip_cr(std::move(line));
}

void write_jsonrpc_line(
    asio::posix::stream_descriptor& stream, std::string_view text) {
  std::array<asio::const_buffer, 2> buffers{
    asio::buffer(text.data(), text.size()), asio::buffer("\n", 1)};
  asio::write(stream, buffers);
}

}  // namespace mcpshim
