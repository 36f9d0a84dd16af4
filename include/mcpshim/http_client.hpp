#pragma once

#include <boost/asio/awaitable.hpp>
#include <string>

#include "mcpshim/config.hpp"

namespace mcpshim {

struct http_reply {
  unsigned status{};
  std::string body;
};

// POST a JSON body to @p target on @p url's host over a fresh connection,
// using TLS for https URLs.  The whole attempt (resolve, connect,
// handshake, write, read) shares one deadline of @p timeout; when it
// passes, the coroutine throws a system_error whose code is
// boost::beast::error::timeout.  Other transport failures throw
// system_error as well.  Any HTTP status is returned, not thrown.
boost::asio::awaitable<http_reply> http_post(
    const proxy_url& url, const std::string& target, const std::string& body,
    const std::string& api_key, millis timeout);

}  // namespace mcpshim
