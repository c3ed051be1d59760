#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/errors.hpp>
#include <surge/core/null_check.hpp>
#include <surge/core/plugins.hpp>
#include <surge/flowable/backpressure.hpp>
#include <surge/flowable/detail/demand.hpp>
#include <surge/flowable/flow_subscription.hpp>
#include <surge/flowable/subscriber.hpp>

namespace surge {
namespace detail {

// Bridges a push producer to a demand-driven subscriber.
// Producer calls are queued according to the strategy; drain() moves queued
// items downstream while there is demand. Only one drain loop runs at a time:
// wip_ counts drain requests and whoever bumps it from zero owns the loop,
// everybody else leaves a "missed" mark the owner picks up.
template <class T>
class emitter_subscription final : public flow_subscription {
public:
  emitter_subscription(subscriber<T> down, backpressure_strategy strategy, std::size_t capacity)
    : down_(std::move(down)), strategy_(strategy), capacity_(capacity ? capacity : 1) {}

  // ---- producer side ----

  void on_next(const T& v) {
    if (is_cancelled()) return;
    if (is_null_value(v)) {
      on_error(std::make_exception_ptr(protocol_violation("on_next called with null")));
      return;
    }
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      switch (strategy_) {
        case backpressure_strategy::buffer:
          queue_.push_back(v);
          break;
        case backpressure_strategy::drop: {
          // items already handed to on_next in this pass still count against demand
          auto r = requested_.load(std::memory_order_acquire);
          if (r == unbounded || r - in_flight_ > static_cast<std::int64_t>(queue_.size())) {
            queue_.push_back(v);
          }
          break;
        }
        case backpressure_strategy::drop_latest:
          if (queue_.size() < capacity_) queue_.push_back(v);
          break;
        case backpressure_strategy::drop_oldest:
          if (queue_.size() >= capacity_) queue_.pop_front();
          queue_.push_back(v);
          break;
        case backpressure_strategy::error:
          if (queue_.size() < capacity_) {
            queue_.push_back(v);
          } else {
            queue_.clear();
            done_ = true;
            error_ = std::make_exception_ptr(missing_backpressure(
                "queue is full: could not emit value due to lack of requests"));
          }
          break;
      }
    }
    drain();
  }

  void on_error(std::exception_ptr e) {
    if (!e) e = std::make_exception_ptr(protocol_violation("on_error called with null"));
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!done_ && !is_cancelled()) {
        done_ = true;
        error_ = std::move(e);
        e = nullptr;
      }
    }
    if (e) {
      plugins::on_error(e);
      return;
    }
    drain();
  }

  void on_completed() {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      done_ = true;
    }
    drain();
  }

  // Outstanding demand not yet satisfied.
  std::int64_t requested() const noexcept { return requested_.load(std::memory_order_acquire); }

  bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

  // Resource released on cancel or after the terminal event.
  void set_cancellable(disposable_ptr d) { resource_.set(std::move(d)); }

  // ---- subscriber side ----

  void request(std::int64_t n) override {
    if (n <= 0) return;
    add_demand(requested_, n);
    drain();
  }

  void cancel() noexcept override {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    resource_.dispose();
    if (wip_.fetch_add(1, std::memory_order_acq_rel) == 0) clear();
  }

private:
  void drain() {
    if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) return;
    int missed = 1;
    for (;;) {
      auto r = requested_.load(std::memory_order_acquire);
      std::int64_t e = 0;
      while (e != r) {
        if (is_cancelled()) {
          clear();
          return;
        }
        std::optional<T> item;
        bool terminal = false;
        {
          std::lock_guard<std::mutex> lock(m_);
          terminal = ready_to_finish();
          if (!terminal && !queue_.empty()) {
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
            ++in_flight_;
          }
        }
        if (terminal) {
          finish();
          return;
        }
        if (!item) break;
        down_.next(*item);
        ++e;
      }
      if (e == r) {
        if (is_cancelled()) {
          clear();
          return;
        }
        bool terminal = false;
        {
          std::lock_guard<std::mutex> lock(m_);
          terminal = ready_to_finish();
        }
        if (terminal) {
          finish();
          return;
        }
      }
      if (e != 0) {
        std::lock_guard<std::mutex> lock(m_);
        produced(requested_, e);
        in_flight_ -= e;
      }
      missed = wip_.fetch_sub(missed, std::memory_order_acq_rel) - missed;
      if (missed == 0) return;
    }
  }

  // Called with m_ held. Queued items go out before the terminal event,
  // except that drop and error hand an error over at once.
  bool ready_to_finish() const {
    if (!done_) return false;
    if (queue_.empty()) return true;
    return error_ && (strategy_ == backpressure_strategy::drop ||
                      strategy_ == backpressure_strategy::error);
  }

  // Delivers the terminal event; terminal events need no demand.
  void finish() {
    std::exception_ptr err;
    {
      std::lock_guard<std::mutex> lock(m_);
      err = error_;
      queue_.clear();
    }
    cancelled_.store(true, std::memory_order_release);
    resource_.dispose();
    auto down = std::exchange(down_, subscriber<T>{});
    if (err) down.error(err);
    else down.completed();
  }

  // Only the drain owner gets here; the loop never runs again afterwards, so
  // the subscriber (which holds this subscription through its guard) is let go.
  void clear() {
    {
      std::lock_guard<std::mutex> lock(m_);
      queue_.clear();
    }
    down_ = subscriber<T>{};
  }

  subscriber<T> down_;
  const backpressure_strategy strategy_;
  const std::size_t capacity_;

  std::mutex m_;
  std::deque<T> queue_;
  bool done_{false};
  std::exception_ptr error_;
  std::int64_t in_flight_{0};  // popped by the drain loop, not yet subtracted from requested_

  std::atomic<std::int64_t> requested_{0};
  std::atomic<int> wip_{0};
  std::atomic<bool> cancelled_{false};
  serial_disposable resource_;
};

} // namespace detail
} // namespace surge
