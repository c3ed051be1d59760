#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <surge/core/errors.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/terminal_gate.hpp>
#include <surge/flowable/flow_subscription.hpp>
#include <surge/flowable/subscriber.hpp>

namespace surge {
namespace detail {

// Sits between a flowable source and the subscriber handed to subscribe().
// One upstream subscription only (a second one is cancelled), at most one
// terminal, nothing after the terminal or after cancel. request(n <= 0)
// cancels the upstream and fails the subscriber with protocol_violation;
// a throwing on_next does the same with the thrown exception.
template <class T>
class subscriber_guard final : public flow_subscription,
                               public std::enable_shared_from_this<subscriber_guard<T>> {
public:
  explicit subscriber_guard(subscriber<T> down) : down_(std::move(down)) {}

  void on_subscribe(const flow_subscription_ptr& s) {
    if (!s) return;
    if (has_upstream_.exchange(true, std::memory_order_acq_rel)) {
      s->cancel();
      plugins::on_error(std::make_exception_ptr(
          protocol_violation("on_subscribe called more than once")));
      return;
    }
    upstream_ = s;
    try {
      down_.subscribe(this->shared_from_this());
    } catch (...) {
      fail(std::current_exception());
    }
  }

  void on_next(const T& v) {
    if (!gate_.is_active() || cancelled_.load(std::memory_order_acquire)) return;
    try {
      down_.next(v);
    } catch (...) {
      fail(std::current_exception());
    }
  }

  void on_error(std::exception_ptr e) {
    if (!e) e = std::make_exception_ptr(protocol_violation("on_error called with null"));
    if (is_cancelled() || !gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    deliver_error(e);
    gate_.mark_terminated();
  }

  void on_completed() {
    if (is_cancelled() || !gate_.try_terminate()) return;
    try {
      down_.completed();
    } catch (...) {
      plugins::on_error(std::current_exception());
    }
    gate_.mark_terminated();
  }

  // Failure raised before the source handed over a subscription.
  void fail_unsubscribed(std::exception_ptr e) {
    if (!has_upstream_.exchange(true, std::memory_order_acq_rel)) {
      upstream_ = std::make_shared<empty_flow_subscription>();
      try {
        down_.subscribe(this->shared_from_this());
      } catch (...) {
        plugins::on_error(std::current_exception());
      }
    }
    fail(std::move(e));
  }

  void request(std::int64_t n) override {
    if (n <= 0) {
      fail(std::make_exception_ptr(
          protocol_violation("request(n) requires n > 0, got " + std::to_string(n))));
      return;
    }
    if (cancelled_.load(std::memory_order_acquire)) return;
    if (upstream_) upstream_->request(n);
  }

  void cancel() noexcept override {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
    if (upstream_) upstream_->cancel();
  }

  bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
  void fail(std::exception_ptr e) {
    cancel();
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    deliver_error(e);
    gate_.mark_terminated();
  }

  void deliver_error(const std::exception_ptr& e) {
    if (!down_.on_error) {
      plugins::on_error(e);
      return;
    }
    try {
      down_.on_error(e);
    } catch (...) {
      plugins::on_error(std::current_exception());
    }
  }

  subscriber<T> down_;
  flow_subscription_ptr upstream_;
  std::atomic<bool> has_upstream_{false};
  std::atomic<bool> cancelled_{false};
  terminal_gate gate_;
};

} // namespace detail
} // namespace surge
