#pragma once

#include <cxxabi.h>
#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mcpshim::utils {
template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// At most @p limit characters of @p text, with "..." appended when cut.
inline std::string preview(std::string_view text, std::size_t limit = 1000) {
  if (text.size() <= limit) return std::string{text};
  return fmt::format("{}...", text.substr(0, limit));
}

// Demangle C++ symbols using __cxa_demangle
inline std::string demangle_symbol(std::string_view mangled) {
  int status = 0;
  std::string result{mangled};
  char* demangled =
      abi::__cxa_demangle(result.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    result = demangled;
    std::free(demangled);  // NOLINT
  }
  return result;
}

}  // namespace mcpshim::utils
