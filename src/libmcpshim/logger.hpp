#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace mcpshim::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

// Names accepted for --log-level.  Unknown names map to info.
inline level level_from_string(std::string_view name) {
  if (name == "trace") return level::trace;
  if (name == "debug") return level::debug;
  if (name == "warn") return level::warning;
  if (name == "error") return level::error;
  return level::info;
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }

struct file_sink_options {
  std::filesystem::path path;
  std::uintmax_t max_size{};
  std::string server_name;
};

// JSON-lines log file, rotated to "<path>.<timestamp>" once it grows past
// max_size.  Throws std::runtime_error if the file can't be opened.
void open_file_sink(const file_sink_options& options);
void close_file_sink();
void write_file_sink(level level, std::string_view message);

inline std::string get_current_timestamp() {
  using namespace std::chrono;
  return fmt::format(
      "{:%Y-%m-%d %H:%M:%S}", floor<milliseconds>(system_clock::now()));
}

// Core logging function.  stdout carries the protocol, so the console
// sink is stderr.
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> format_str, Args&&... args) {
  if (level > global_level) return;

  auto message = fmt::format(format_str, std::forward<Args>(args)...);
  fmt::print(
      stderr, "{} {}:{} {}: {}\n", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().c_str(),
      location.line(), level_to_string(level), message);
  write_file_sink(level, message);
}

}  // namespace mcpshim::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                                \
  mcpshim::logger::log(                                               \
      mcpshim::logger::level::trace, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                                \
  mcpshim::logger::log(                                               \
      mcpshim::logger::level::debug, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_INFO(...)                                                \
  mcpshim::logger::log(                                              \
      mcpshim::logger::level::info, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_WARN(...)                                                   \
  mcpshim::logger::log(                                                 \
      mcpshim::logger::level::warning, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_ERROR(...)                                                \
  mcpshim::logger::log(                                               \
      mcpshim::logger::level::error, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_FATAL(...)                                                \
  mcpshim::logger::log(                                               \
      mcpshim::logger::level::fatal, std::source_location::current(), \
      __VA_ARGS__)
// NOLINTEND
