#include "mcpshim/config.hpp"

#include <re2/re2.h>

#include <string>

#include "utils.hpp"

namespace mcpshim {

proxy_url parse_proxy_url(std::string_view url) {
  static const RE2 url_re{R"(^(https?)://([^/:?#]+)(?::(\d+))?(/[^?#]*)?$)"};

  proxy_url out;
  std::string port;
  std::string path;
  const std::string text{url};
  if (!RE2::FullMatch(text, url_re, &out.scheme, &out.host, &port, &path))
    utils::throwf(
        "Unsupported proxy URL '{}' (expected http[s]://host[:port][/path])",
        text);

  out.port = port.empty() ? out.default_port() : port;
  while (!path.empty() && path.back() == '/') path.pop_back();
  out.base_path = path;
  return out;
}

}  // namespace mcpshim
