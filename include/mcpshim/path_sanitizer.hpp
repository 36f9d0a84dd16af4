#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mcpshim/jsonrpc.hpp"

namespace mcpshim {

/// Vets filesystem paths against a list of allowed directory prefixes.
class path_sanitizer {
 public:
  // Prefixes are normalized here once.  An empty list allows any absolute
  // path.
  explicit path_sanitizer(const std::vector<std::string>& allowed_paths);

  /// Normalized form of @p raw, or nullopt if @p raw is relative, empty, or
  /// outside every allowed prefix.
  [[nodiscard]] std::optional<std::string> sanitize(std::string_view raw) const;

  /// Rewrite the path arguments of a "tools/call" request in place.  On
  /// rejection, sets @c req.violation and leaves the request otherwise
  /// untouched from that argument on.
  void apply(request& req) const;

  [[nodiscard]] const std::vector<std::string>& allowed_paths() const {
    return allowed_;
  }

 private:
  [[nodiscard]] bool is_allowed(const std::string& normalized) const;

  std::vector<std::string> allowed_;
};

/// Lexically normalized absolute-or-relative path, without a trailing
/// separator (except for "/" itself).
std::string normalize_path(std::string_view raw);

}  // namespace mcpshim
