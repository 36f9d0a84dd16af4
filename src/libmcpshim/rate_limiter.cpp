#include "mcpshim/rate_limiter.hpp"

#include <algorithm>

namespace mcpshim {

rate_limiter::rate_limiter(const config& cfg)
    : limit_{static_cast<std::size_t>(std::max(cfg.rate_limit_per_minute, 0))} {}

bool rate_limiter::would_exceed(clock_t::time_point now) {
  // Timestamps are appended in order, so the stale ones are at the front.
  while (!stamps_.empty() && now - stamps_.front() >= window)
    stamps_.pop_front();
  return stamps_.size() >= limit_;
}

void rate_limiter::record(clock_t::time_point now) { stamps_.push_back(now); }

}  // namespace mcpshim
