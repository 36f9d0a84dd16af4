#include "mcpshim/options.hpp"

#include <CLI/CLI.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>

namespace fs = std::filesystem;

namespace mcpshim {

std::vector<std::string> split_path_list(std::string_view list) {
  std::vector<std::string> out;
  while (!list.empty()) {
    auto comma = list.find(',');
    auto item = list.substr(0, comma);
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    list.remove_prefix(comma + 1);
  }
  return out;
}

std::optional<int> parse_options(std::span<char*> args, config& cfg) {
  CLI::App app{"Forward stdio JSONRPC requests to a remote MCP proxy"};

  std::string allowed_paths{};
  std::int64_t cache_ttl_ms{cfg.cache_ttl.count()};
  std::int64_t timeout_ms{cfg.timeout.count()};
  std::int64_t retry_initial_ms{cfg.retry_initial_delay.count()};
  std::int64_t retry_max_ms{cfg.retry_max_delay.count()};
  std::string log_file_path{};

  auto valid_url = [](const std::string& url) -> std::string {
    try {
      parse_proxy_url(url);
    } catch (const std::exception& e) {
      return e.what();
    }
    return {};
  };

  app.add_option("--proxy-url", cfg.proxy_url, "Base URL of the MCP proxy")
    ->envname("MCP_PROXY_URL")
    ->check(valid_url)
    ->capture_default_str();
  app.add_option(
      "--server-name", cfg.server_name,
      "Server name appended to the proxy URL")
    ->envname("MCP_SERVER_NAME")
    ->capture_default_str();
  app.add_option("--api-key", cfg.api_key, "Bearer token for the proxy")
    ->envname("MCP_API_KEY");
  app.add_option(
      "--max-request-size", cfg.max_request_size,
      "Largest accepted request, in bytes")
    ->envname("MCP_MAX_REQUEST_SIZE")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--rate-limit", cfg.rate_limit_per_minute, "Requests allowed per minute")
    ->envname("MCP_RATE_LIMIT")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option(
      "--allowed-paths", allowed_paths,
      "Comma separated directories filesystem requests may touch")
    ->envname("MCP_ALLOWED_PATHS");
  app.add_option("--cache", cfg.cache_enabled, "Cache read-only responses")
    ->envname("MCP_CACHE")
    ->capture_default_str();
  app.add_option(
      "--cache-ttl-ms", cache_ttl_ms, "Lifetime of a cached response")
    ->envname("MCP_CACHE_TTL_MS")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option("--timeout-ms", timeout_ms, "Deadline for one HTTP attempt")
    ->envname("MCP_TIMEOUT_MS")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option(
      "--max-retries", cfg.max_retries,
      "Retries after a failed HTTP attempt")
    ->envname("MCP_MAX_RETRIES")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option(
      "--retry-initial-delay-ms", retry_initial_ms, "First backoff delay")
    ->envname("MCP_RETRY_INITIAL_DELAY_MS")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option("--retry-max-delay-ms", retry_max_ms, "Backoff delay cap")
    ->envname("MCP_RETRY_MAX_DELAY_MS")
    ->check(CLI::NonNegativeNumber)
    ->capture_default_str();
  app.add_option("--log-level", cfg.log_level, "Console and file log level")
    ->envname("MCP_LOG_LEVEL")
    ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
    ->capture_default_str();
  app.add_option("--log-file", cfg.log_to_file, "Also log to a file")
    ->envname("MCP_LOG_FILE")
    ->capture_default_str();
  app.add_option(
      "--log-max-size", cfg.log_max_size,
      "Rotate the log file past this many bytes")
    ->envname("MCP_LOG_MAX_SIZE")
    ->check(CLI::PositiveNumber)
    ->capture_default_str();
  app.add_option("--log-file-path", log_file_path, "Log file location")
    ->envname("MCP_LOG_FILE_PATH");

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  cfg.allowed_paths = split_path_list(allowed_paths);
  cfg.cache_ttl = millis{cache_ttl_ms};
  cfg.timeout = millis{timeout_ms};
  cfg.retry_initial_delay = millis{retry_initial_ms};
  cfg.retry_max_delay = millis{retry_max_ms};
  cfg.log_file = log_file_path.empty()
                     ? fs::temp_directory_path() /
                           ("mcp-shim-" + cfg.server_name + ".log")
                     : fs::path{log_file_path};

  return std::nullopt;
}

}  // namespace mcpshim
