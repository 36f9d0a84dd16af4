#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcpshim {

namespace fs = std::filesystem;

using millis = std::chrono::milliseconds;

/// Pieces of the proxy base URL, split once at startup.
struct proxy_url {
  std::string scheme{"http"};
  std::string host;
  std::string port{"80"};
  std::string base_path;  // no trailing '/', may be empty

  [[nodiscard]] bool is_tls() const { return scheme == "https"; }
  [[nodiscard]] std::string default_port() const {
    return is_tls() ? "443" : "80";
  }
};

/// Parse an "http[s]://host[:port][/base]" URL.  Throws std::runtime_error
/// on anything else.
proxy_url parse_proxy_url(std::string_view url);

/// Process-wide settings.  Built once by parse_options() and handed by
/// const reference to every component.
struct config {
  std::string proxy_url{"http://localhost:9876"};
  std::string server_name{"filesystem"};
  std::string api_key{};

  std::size_t max_request_size{5 * 1024 * 1024};
  int rate_limit_per_minute{60};
  std::vector<std::string> allowed_paths{};

  bool cache_enabled{true};
  millis cache_ttl{5 * 60 * 1000};
  millis timeout{30000};

  int max_retries{3};
  millis retry_initial_delay{100};
  millis retry_max_delay{5000};

  std::string log_level{"info"};
  bool log_to_file{false};
  std::uintmax_t log_max_size{10 * 1024 * 1024};
  fs::path log_file{};

  // True when requests should have their path arguments vetted.
  [[nodiscard]] bool is_filesystem_server() const {
    return server_name == "filesystem";
  }
};

}  // namespace mcpshim
