#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

#include "mcpshim/config.hpp"

namespace mcpshim {

namespace json = boost::json;

/// True for "tools/call" requests naming a tool that changes files or the
/// memory graph.  Such calls are never cached.
bool is_mutating_tool_call(const json::object& request);

/// Memoizes successful proxy responses for a fixed time.  Expired entries
/// are dropped when looked up.
class response_cache {
 public:
  using clock_t = std::chrono::steady_clock;

  explicit response_cache(const config& cfg);

  /// "<method>:<canonical params>", or nullopt for uncacheable requests.
  static std::optional<std::string> key(const json::object& request);

  /// Stored response re-addressed to @p id, if present and fresh.
  std::optional<json::object> get(
      const std::string& key, const json::value& id,
      clock_t::time_point now = clock_t::now());

  /// Store @p response unless it carries an "error" member.
  void put(
      const std::string& key, const json::object& response,
      clock_t::time_point now = clock_t::now());

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool enabled() const { return enabled_; }

 private:
  struct entry {
    json::object value;
    clock_t::time_point expiry;
  };

  bool enabled_;
  millis ttl_;
  std::unordered_map<std::string, entry> entries_;
};

}  // namespace mcpshim
