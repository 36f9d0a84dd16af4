#include <unistd.h>

#include <csignal>
#include <exception>
#include <span>
#include <typeinfo>

#include "../libmcpshim/logger.hpp"
#include "../libmcpshim/utils.hpp"
#include "mcpshim/config.hpp"
#include "mcpshim/options.hpp"
#include "mcpshim/path_sanitizer.hpp"
#include "stdio.hpp"

namespace logger = mcpshim::logger;

int main(int argc, char* argv[]) {
  mcpshim::config cfg{};

  auto done = mcpshim::parse_options(std::span(argv, argc), cfg);
  if (done) return done.value();

  logger::set_level(logger::level_from_string(cfg.log_level));

  // A client hanging up should surface as a write error, not kill us
  std::signal(SIGPIPE, SIG_IGN);

  int retval = 0;
  try {
    if (cfg.log_to_file)
      logger::open_file_sink(
          {.path = cfg.log_file,
           .max_size = cfg.log_max_size,
           .server_name = cfg.server_name});

    LOG_INFO(
        "MCP Shim started: server={} proxy={} pid={}", cfg.server_name,
        cfg.proxy_url, ::getpid());

    if (!cfg.allowed_paths.empty()) {
      mcpshim::path_sanitizer sanitizer{cfg.allowed_paths};
      for (const auto& p : sanitizer.allowed_paths())
        LOG_INFO("Allowed path: {}", p);
    }

    mcpshim::run_stdio_server(cfg);
    LOG_INFO("MCP Shim exiting");
  } catch (const std::exception& e) {
    LOG_FATAL(
        "Uncaught exception {}: {}",
        mcpshim::utils::demangle_symbol(typeid(e).name()), e.what());
    retval = 1;
  }

  logger::close_file_sink();
  return retval;
}
