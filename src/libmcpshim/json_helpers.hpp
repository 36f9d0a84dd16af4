#pragma once

#include <algorithm>
#include <boost/json.hpp>
#include <string>
#include <vector>

namespace mcpshim {

namespace json = boost::json;

// Copy of @p v with object members sorted by key, at every depth.
inline json::value canonicalize(const json::value& v) {
  if (const auto* obj = v.if_object()) {
    std::vector<const json::key_value_pair*> members{};
    members.reserve(obj->size());
    for (const auto& kv : *obj) members.push_back(&kv);
    std::sort(members.begin(), members.end(), [](auto* a, auto* b) {
      return a->key() < b->key();
    });
    json::object out{};
    for (const auto* kv : members) out[kv->key()] = canonicalize(kv->value());
    return out;
  }
  if (const auto* arr = v.if_array()) {
    json::array out{};
    out.reserve(arr->size());
    for (const auto& e : *arr) out.push_back(canonicalize(e));
    return out;
  }
  return v;
}

inline std::string canonical_serialize(const json::value& v) {
  return json::serialize(canonicalize(v));
}

inline std::string string_or(
    const json::object& obj, std::string_view key, std::string fallback) {
  if (const auto* v = obj.if_contains(key); v && v->is_string())
    return std::string{v->get_string()};
  return fallback;
}

}  // namespace mcpshim
