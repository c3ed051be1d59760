#pragma once
#include <atomic>
#include <cstdint>

#include <surge/core/config.hpp>

namespace surge {
namespace detail {

// Adds n (> 0) to the outstanding demand, saturating at unbounded.
// Returns the previous value.
inline std::int64_t add_demand(std::atomic<std::int64_t>& requested, std::int64_t n) noexcept {
  auto cur = requested.load(std::memory_order_acquire);
  for (;;) {
    if (cur == unbounded) return unbounded;
    auto next = cur > unbounded - n ? unbounded : cur + n;
    if (requested.compare_exchange_weak(cur, next, std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
      return cur;
    }
  }
}

// Subtracts n delivered items unless demand is unbounded. Returns the new value.
inline std::int64_t produced(std::atomic<std::int64_t>& requested, std::int64_t n) noexcept {
  auto cur = requested.load(std::memory_order_acquire);
  for (;;) {
    if (cur == unbounded) return unbounded;
    auto next = cur - n;
    if (next < 0) next = 0;
    if (requested.compare_exchange_weak(cur, next, std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
      return next;
    }
  }
}

} // namespace detail
} // namespace surge
