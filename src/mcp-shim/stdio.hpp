#pragma once

#include "mcpshim/config.hpp"

namespace mcpshim {

// Run the shim on stdin/stdout.  Returns once stdin reaches EOF and every
// pending response has been written, or as soon as SIGINT/SIGTERM arrives.
void run_stdio_server(const config& cfg);

}  // namespace mcpshim
