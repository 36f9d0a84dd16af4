#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpshim::test {

namespace json = boost::json;

struct recorded_request {
  std::string target;
  std::string content_type;
  std::string authorization;
  std::string body;

  [[nodiscard]] json::object json_body() const {
    return json::parse(body).as_object();
  }
};

struct fake_reply {
  unsigned status{200};
  std::string body;
  std::chrono::milliseconds delay{0};
};

// Minimal HTTP server standing in for the MCP proxy.  Lives on the test's
// io_context; stop() closes the listener so run() can return.
class fake_proxy {
 public:
  using handler_t = std::function<fake_reply(const recorded_request&)>;

  fake_proxy(boost::asio::io_context& ctx, handler_t handler);

  [[nodiscard]] std::string url() const;
  [[nodiscard]] const std::vector<recorded_request>& requests() const {
    return requests_;
  }
  void stop();

  // Replies 200 with @p body to everything.
  static handler_t always(std::string body);

 private:
  boost::asio::awaitable<void> accept_loop();
  boost::asio::awaitable<void> serve(boost::asio::ip::tcp::socket socket);

  boost::asio::ip::tcp::acceptor acceptor_;
  handler_t handler_;
  std::vector<recorded_request> requests_;
};

// A port nothing listens on.
unsigned short unused_port();

// Run @p task on @p ctx to completion, calling @p on_done (if any) as soon
// as it finishes so that helpers like fake_proxy can wind down.
json::object run_to_completion(
    boost::asio::io_context& ctx, boost::asio::awaitable<json::object> task,
    const std::function<void()>& on_done = {});

}  // namespace mcpshim::test
