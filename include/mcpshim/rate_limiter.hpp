#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

#include "mcpshim/config.hpp"

namespace mcpshim {

/// Sliding one-minute window of request timestamps.
class rate_limiter {
 public:
  using clock_t = std::chrono::steady_clock;
  static constexpr std::chrono::seconds window{60};

  explicit rate_limiter(const config& cfg);

  /// Forget requests older than the window, then report whether one more
  /// request would go over the limit.
  bool would_exceed(clock_t::time_point now = clock_t::now());

  void record(clock_t::time_point now = clock_t::now());

  [[nodiscard]] std::size_t in_window() const { return stamps_.size(); }

 private:
  std::size_t limit_;
  std::deque<clock_t::time_point> stamps_;
};

}  // namespace mcpshim
