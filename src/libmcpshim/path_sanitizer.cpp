#include "mcpshim/path_sanitizer.hpp"

#include <fmt/format.h>

#include <filesystem>

#include "logger.hpp"

namespace fs = std::filesystem;

namespace mcpshim {

std::string normalize_path(std::string_view raw) {
  auto normalized = fs::path{raw}.lexically_normal().string();
  while (normalized.size() > 1 && normalized.back() == '/')
    normalized.pop_back();
  return normalized;
}

path_sanitizer::path_sanitizer(const std::vector<std::string>& allowed_paths) {
  allowed_.reserve(allowed_paths.size());
  for (const auto& p : allowed_paths) {
    if (p.empty()) continue;
    allowed_.push_back(normalize_path(p));
  }
}

bool path_sanitizer::is_allowed(const std::string& normalized) const {
  if (allowed_.empty()) return true;
  for (const auto& prefix : allowed_) {
    if (prefix == "/") return true;
    if (normalized == prefix) return true;
    if (normalized.starts_with(prefix) && normalized.size() > prefix.size() &&
        normalized[prefix.size()] == '/')
      return true;
  }
  return false;
}

std::optional<std::string> path_sanitizer::sanitize(
    std::string_view raw) const {
  if (raw.empty()) {
    LOG_WARN("Rejected empty path");
    return std::nullopt;
  }

  auto normalized = normalize_path(raw);
  if (!fs::path{normalized}.is_absolute()) {
    // Relative to what?  We don't know the server's working directory.
    LOG_WARN("Rejected relative path: {}", raw);
    return std::nullopt;
  }

  if (!is_allowed(normalized)) {
    LOG_WARN("Access to path outside allowed directories: {}", normalized);
    return std::nullopt;
  }
  return normalized;
}

void path_sanitizer::apply(request& req) const {
  auto* method = req.message.if_contains("method");
  if (!method || !method->is_string() || method->get_string() != "tools/call")
    return;
  auto* params = req.message.if_contains("params");
  if (!params || !params->is_object()) return;
  auto* arguments = params->get_object().if_contains("arguments");
  if (!arguments || !arguments->is_object()) return;
  auto& args = arguments->get_object();

  if (auto* p = args.if_contains("path"); p && p->is_string()) {
    std::string raw{p->get_string()};
    auto clean = sanitize(raw);
    if (!clean) {
      LOG_WARN("Blocked access to path: {}", raw);
      req.violation = fmt::format("Access denied to path: {}", raw);
      return;
    }
    p->emplace_string() = *clean;
  }

  if (auto* p = args.if_contains("paths"); p && p->is_array()) {
    json::array cleaned{};
    for (const auto& entry : p->get_array()) {
      std::optional<std::string> clean{};
      if (entry.is_string()) clean = sanitize(std::string{entry.get_string()});
      if (!clean) {
        LOG_WARN(
            "Blocked access to one or more of {} paths",
            p->get_array().size());
        req.violation = "Access denied to one or more requested paths";
        return;
      }
      cleaned.push_back(json::value_from(*clean));
    }
    *p = std::move(cleaned);
  }

  // source and destination are vetted independently
  auto vet = [&](std::string_view key, std::string_view what) {
    auto* p = args.if_contains(key);
    if (!p || !p->is_string()) return true;
    auto clean = sanitize(std::string{p->get_string()});
    if (!clean) {
      req.violation = fmt::format("Access denied to {} path", what);
      return false;
    }
    p->emplace_string() = *clean;
    return true;
  };
  if (!vet("source", "source")) return;
  vet("destination", "destination");
}

}  // namespace mcpshim
