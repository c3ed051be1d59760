#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/errors.hpp>
#include <surge/core/null_check.hpp>
#include <surge/core/observer.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/subscription.hpp>
#include <surge/core/terminal_gate.hpp>

namespace surge {

namespace detail {

// Sits between a source and the observer handed to subscribe().
// Enforces the observer contract whatever the source does: the downstream
// on_subscribe already happened, at most one terminal gets through, nothing
// is delivered after the terminal or after dispose, and a throwing callback
// or a null value turns into the terminal on_error.
template <class T>
class contract_guard {
public:
  explicit contract_guard(observer<T> down)
    : down_(std::move(down)), upstream_(std::make_shared<serial_disposable>()) {}

  const std::shared_ptr<serial_disposable>& upstream() const noexcept { return upstream_; }
  const observer<T>& downstream() const noexcept { return down_; }

  void on_subscribe(const disposable_ptr& d) {
    if (!d) return;
    if (has_upstream_.exchange(true, std::memory_order_acq_rel)) {
      d->dispose();
      plugins::on_error(std::make_exception_ptr(
          protocol_violation("on_subscribe called more than once")));
      return;
    }
    upstream_->replace(d);
  }

  void on_next(const T& v) {
    if (!gate_.is_active() || upstream_->is_disposed()) return;
    if (is_null_value(v)) {
      fail(std::make_exception_ptr(protocol_violation("on_next called with null")));
      return;
    }
    try {
      down_.next(v);
    } catch (...) {
      fail(std::current_exception());
    }
  }

  void on_error(std::exception_ptr e) {
    if (!e) e = std::make_exception_ptr(protocol_violation("on_error called with null"));
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    if (upstream_->is_disposed()) {
      // cancelled downstream: nobody is listening any more
      gate_.mark_terminated();
      plugins::on_error(e);
      return;
    }
    deliver_error(e);
    gate_.mark_terminated();
    upstream_->dispose();
  }

  void on_completed() {
    if (!gate_.try_terminate()) return;
    if (!upstream_->is_disposed()) {
      try {
        down_.completed();
      } catch (...) {
        plugins::on_error(std::current_exception());
      }
    }
    gate_.mark_terminated();
    upstream_->dispose();
  }

  // Failure raised on our side (throwing callback, throwing source).
  void fail(std::exception_ptr e) {
    upstream_->dispose();
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    deliver_error(e);
    gate_.mark_terminated();
  }

private:
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

  observer<T> down_;
  std::shared_ptr<serial_disposable> upstream_;
  std::atomic<bool> has_upstream_{false};
  terminal_gate gate_;
};

} // namespace detail

// Lazy, repeatable description of a value sequence.
// Every subscribe() starts one independent execution.
template <class T>
class observable {
public:
  using value_type  = T;
  using OnSubscribe = typename observer<T>::OnSubscribe;
  using OnNext      = typename observer<T>::OnNext;
  using OnErr       = typename observer<T>::OnErr;
  using OnDone      = typename observer<T>::OnDone;
  using source_fn   = std::function<void(observer<T>)>;

  // Factory: the source receives the observer and signals on_subscribe itself.
  static observable make(source_fn fn) {
    return observable(std::move(fn));
  }

  // Factory: create observable from subscribe function returning its cancellation.
  static observable create(std::function<subscription(OnNext, OnErr, OnDone)> impl) {
    return make([impl = std::move(impl)](observer<T> o) {
      auto slot = std::make_shared<serial_disposable>();
      o.subscribe(slot);
      subscription s = impl(
        [o](const T& v) { o.next(v); },
        [o](std::exception_ptr e) { o.error(std::move(e)); },
        [o] { o.completed(); });
      slot->replace(s.release());
    });
  }

  static observable empty() {
    return make([](observer<T> o) {
      o.subscribe(empty_disposable());
      o.completed();
    });
  }

  static observable never() {
    return make([](observer<T> o) { o.subscribe(empty_disposable()); });
  }

  static observable error(std::exception_ptr e) {
    return make([e](observer<T> o) {
      o.subscribe(empty_disposable());
      o.error(e);
    });
  }

  // Subscription. Exceptions thrown by the source end up in on_error.
  subscription subscribe(observer<T> o) const {
    auto g = std::make_shared<detail::contract_guard<T>>(std::move(o));
    const auto& up = g->upstream();

    try {
      g->downstream().subscribe(up);
    } catch (...) {
      g->fail(std::current_exception());
      return subscription(disposable_ptr(up));
    }
    if (up->is_disposed()) return subscription(disposable_ptr(up));

    observer<T> guarded;
    guarded.on_subscribe = [g](const disposable_ptr& d) { g->on_subscribe(d); };
    guarded.on_next      = [g](const T& v) { g->on_next(v); };
    guarded.on_error     = [g](std::exception_ptr e) { g->on_error(std::move(e)); };
    guarded.on_completed = [g] { g->on_completed(); };

    try {
      source_(std::move(guarded));
    } catch (...) {
      g->fail(std::current_exception());
    }
    return subscription(disposable_ptr(up));
  }

  subscription subscribe(OnNext on_next,
                         OnErr  on_err  = {},
                         OnDone on_done = {}) const {
    return subscribe(make_observer<T>(std::move(on_next), std::move(on_err), std::move(on_done)));
  }

private:
  explicit observable(source_fn fn) : source_(std::move(fn)) {}

  source_fn source_;
};

} // namespace surge
