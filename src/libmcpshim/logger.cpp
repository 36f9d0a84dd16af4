#include "logger.hpp"

#include <fmt/std.h>

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

#include "utils.hpp"

namespace json = boost::json;
namespace fs = std::filesystem;

namespace mcpshim::logger {

namespace {

struct file_sink {
  file_sink_options options;
  std::ofstream out;
};

std::optional<file_sink> the_sink;  // NOLINT

std::string rotation_suffix() {
  using namespace std::chrono;
  return fmt::format(
      "{:%Y-%m-%dT%H-%M-%S}", floor<seconds>(system_clock::now()));
}

void rotate(file_sink& sink) {
  sink.out.close();
  auto rotated = sink.options.path;
  rotated += "." + rotation_suffix();
  std::error_code ec;
  fs::rename(sink.options.path, rotated, ec);
  if (ec)
    fmt::print(stderr, "Failed to rotate log file: {}\n", ec.message());
  sink.out.open(sink.options.path, std::ios::app);
}

}  // namespace

void open_file_sink(const file_sink_options& options) {
  file_sink sink{options, std::ofstream{options.path, std::ios::app}};
  if (!sink.out)
    utils::throwf("Could not open log file {}", options.path);
  the_sink.emplace(std::move(sink));
}

void close_file_sink() {
  if (!the_sink) return;
  the_sink->out.flush();
  the_sink.reset();
}

void write_file_sink(level level, std::string_view message) {
  if (!the_sink || !the_sink->out) return;

  json::object entry;
  entry["time"] = get_current_timestamp();
  entry["level"] = level_to_string(level);
  entry["message"] = message;
  entry["server"] = the_sink->options.server_name;
  the_sink->out << json::serialize(entry) << '\n';
  the_sink->out.flush();

  auto size = the_sink->out.tellp();
  if (size > 0 &&
      static_cast<std::uintmax_t>(size) > the_sink->options.max_size)
    rotate(*the_sink);
}

}  // namespace mcpshim::logger
