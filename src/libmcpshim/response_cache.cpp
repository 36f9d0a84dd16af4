#include "mcpshim/response_cache.hpp"

#include <array>
#include <string_view>

#include "json_helpers.hpp"
#include "logger.hpp"

namespace mcpshim {

bool is_mutating_tool_call(const json::object& request) {
  // Substring match, so "delete" also covers any tool with it in its name.
  static constexpr std::array<std::string_view, 11> mutation_markers{
    "write_file",       "edit_file",        "create_directory",
    "move_file",        "delete",           "create_entities",
    "delete_entities",  "create_relations", "delete_relations",
    "add_observations", "delete_observations"};

  if (string_or(request, "method", {}) != "tools/call") return false;
  const auto* params = request.if_contains("params");
  if (!params || !params->is_object()) return false;

  auto name = string_or(params->get_object(), "name", {});
  if (name.empty()) return false;
  for (auto marker : mutation_markers)
    if (name.find(marker) != std::string::npos) return true;
  return false;
}

response_cache::response_cache(const config& cfg)
    : enabled_{cfg.cache_enabled}, ttl_{cfg.cache_ttl} {}

std::optional<std::string> response_cache::key(const json::object& request) {
  if (is_mutating_tool_call(request)) return std::nullopt;

  std::string params{"null"};
  if (const auto* p = request.if_contains("params"))
    params = canonical_serialize(*p);
  return string_or(request, "method", {}) + ":" + params;
}

std::optional<json::object> response_cache::get(
    const std::string& key, const json::value& id, clock_t::time_point now) {
  if (!enabled_) return std::nullopt;

  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;

  if (now > it->second.expiry) {
    entries_.erase(it);
    return std::nullopt;
  }

  LOG_DEBUG("Cache hit for key: {}", key);
  json::object hit{it->second.value};
  hit["id"] = id;
  return hit;
}

void response_cache::put(
    const std::string& key, const json::object& response,
    clock_t::time_point now) {
  if (!enabled_ || response.contains("error")) return;

  entries_.insert_or_assign(key, entry{response, now + ttl_});
  LOG_DEBUG("Cached response for key: {}", key);
}

}  // namespace mcpshim
