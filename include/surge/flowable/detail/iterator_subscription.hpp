#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include <surge/core/config.hpp>
#include <surge/core/errors.hpp>
#include <surge/core/null_check.hpp>
#include <surge/flowable/detail/demand.hpp>
#include <surge/flowable/flow_subscription.hpp>
#include <surge/flowable/subscriber.hpp>

namespace surge {
namespace detail {

// Emits at(0) .. at(count - 1) on demand. The thread whose request moves the
// demand away from zero runs the emission loop; requests arriving meanwhile
// (including re-entrant ones from on_next) only add to the counter.
template <class T>
class iterator_subscription final : public flow_subscription {
public:
  using generator = std::function<T(std::size_t)>;

  iterator_subscription(subscriber<T> down, generator at, std::size_t count)
    : down_(std::move(down)), at_(std::move(at)), end_(count) {}

  void request(std::int64_t n) override {
    if (n <= 0) return;
    if (add_demand(requested_, n) != 0) return;
    bool finished = n == unbounded ? fast_path() : slow_path(n);
    // drops the subscriber -> guard -> subscription cycle
    if (finished) down_ = subscriber<T>{};
  }

  void cancel() noexcept override {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    // zero demand means no emission loop is running that could still use down_
    if (add_demand(requested_, 1) == 0) down_ = subscriber<T>{};
  }

private:
  bool emit(std::size_t i) {
    T v = at_(i);
    if (is_null_value(v)) {
      cancelled_.store(true, std::memory_order_release);
      down_.error(std::make_exception_ptr(protocol_violation("source produced a null value")));
      return false;
    }
    down_.next(v);
    return true;
  }

  // Both loops return true once nothing more will be emitted.
  bool fast_path() {
    for (auto i = index_; i != end_; ++i) {
      if (cancelled()) return true;
      if (!emit(i)) return true;
    }
    if (!cancelled()) down_.completed();
    return true;
  }

  bool slow_path(std::int64_t r) {
    std::int64_t e = 0;
    auto i = index_;
    for (;;) {
      while (e != r && i != end_) {
        if (cancelled()) return true;
        if (!emit(i)) return true;
        ++e;
        ++i;
      }
      if (i == end_) {
        if (!cancelled()) down_.completed();
        return true;
      }
      r = requested_.load(std::memory_order_acquire);
      if (e == r) {
        index_ = i;
        r = produced(requested_, e);
        if (r == 0) return false;
        e = 0;
      }
    }
  }

  bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

  subscriber<T> down_;
  generator at_;
  const std::size_t end_;
  std::size_t index_{0};   // owned by the emission loop
  std::atomic<std::int64_t> requested_{0};
  std::atomic<bool> cancelled_{false};
};

} // namespace detail
} // namespace surge
