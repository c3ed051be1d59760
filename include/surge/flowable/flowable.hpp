#pragma once
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <surge/core/config.hpp>
#include <surge/core/disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/subscription.hpp>
#include <surge/flowable/backpressure.hpp>
#include <surge/flowable/detail/emitter_subscription.hpp>
#include <surge/flowable/detail/iterator_subscription.hpp>
#include <surge/flowable/detail/subscriber_guard.hpp>
#include <surge/flowable/flow_subscription.hpp>
#include <surge/flowable/subscriber.hpp>

namespace surge {

// Producer-side handle passed to flowable<T>::create.
// Copies share the same underlying subscription.
template <class T>
class flowable_emitter {
public:
  explicit flowable_emitter(std::shared_ptr<detail::emitter_subscription<T>> s) : s_(std::move(s)) {}

  void on_next(const T& v) const { s_->on_next(v); }
  void on_error(std::exception_ptr e) const { s_->on_error(std::move(e)); }
  void on_completed() const { s_->on_completed(); }

  // Outstanding demand; a producer may use it to slow down on its own.
  std::int64_t requested() const noexcept { return s_->requested(); }
  bool is_cancelled() const noexcept { return s_->is_cancelled(); }

  // Released on cancel or once the terminal event went out.
  void set_cancellable(std::function<void()> fn) const { s_->set_cancellable(make_disposable(std::move(fn))); }
  void set_disposable(disposable_ptr d) const { s_->set_cancellable(std::move(d)); }

private:
  std::shared_ptr<detail::emitter_subscription<T>> s_;
};

// Demand-driven counterpart of observable<T>: a source never delivers more
// items than the subscriber requested.
template <class T>
class flowable {
public:
  using value_type = T;
  using source_fn  = std::function<void(subscriber<T>)>;
  using emitter_fn = std::function<void(flowable_emitter<T>)>;
  using OnNext     = typename subscriber<T>::OnNext;
  using OnErr      = typename subscriber<T>::OnErr;
  using OnDone     = typename subscriber<T>::OnDone;

  // Raw source: receives the subscriber and must call on_subscribe itself.
  static flowable make(source_fn fn) { return flowable(std::move(fn)); }

  // Push producer adapted to demand by the given strategy. capacity bounds
  // the queue of drop_latest / drop_oldest / error.
  static flowable create(emitter_fn fn,
                         backpressure_strategy strategy,
                         std::size_t capacity = default_buffer_size) {
    return make([fn = std::move(fn), strategy, capacity](subscriber<T> s) {
      auto sub = std::make_shared<detail::emitter_subscription<T>>(s, strategy, capacity);
      s.subscribe(sub);
      flowable_emitter<T> em(sub);
      try {
        fn(em);
      } catch (...) {
        em.on_error(std::current_exception());
      }
    });
  }

  static flowable from(std::vector<T> items) {
    if (items.empty()) return empty();
    auto data = std::make_shared<const std::vector<T>>(std::move(items));
    return make([data](subscriber<T> s) {
      s.subscribe(std::make_shared<detail::iterator_subscription<T>>(
          s, [data](std::size_t i) { return (*data)[i]; }, data->size()));
    });
  }

  template <class... Ts>
  static flowable just(Ts&&... vs) {
    return from(std::vector<T>{T(std::forward<Ts>(vs))...});
  }

  // start, start + 1, ..., start + count - 1
  static flowable range(T start, std::size_t count) requires std::integral<T> {
    if (count == 0) return empty();
    return make([start, count](subscriber<T> s) {
      s.subscribe(std::make_shared<detail::iterator_subscription<T>>(
          s, [start](std::size_t i) { return static_cast<T>(start + static_cast<T>(i)); }, count));
    });
  }

  static flowable empty() {
    return make([](subscriber<T> s) {
      s.subscribe(std::make_shared<detail::empty_flow_subscription>());
      s.completed();
    });
  }

  static flowable never() {
    return make([](subscriber<T> s) {
      s.subscribe(std::make_shared<detail::empty_flow_subscription>());
    });
  }

  static flowable error(std::exception_ptr e) {
    return make([e](subscriber<T> s) {
      s.subscribe(std::make_shared<detail::empty_flow_subscription>());
      s.error(e);
    });
  }

  void subscribe(subscriber<T> s) const {
    auto g = std::make_shared<detail::subscriber_guard<T>>(std::move(s));
    subscriber<T> guarded;
    guarded.on_subscribe = [g](const flow_subscription_ptr& up) { g->on_subscribe(up); };
    guarded.on_next      = [g](const T& v) { g->on_next(v); };
    guarded.on_error     = [g](std::exception_ptr e) { g->on_error(std::move(e)); };
    guarded.on_completed = [g] { g->on_completed(); };
    try {
      source_(std::move(guarded));
    } catch (...) {
      g->fail_unsubscribed(std::current_exception());
    }
  }

  // Requests everything up front; the returned subscription cancels.
  subscription subscribe(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    auto slot = std::make_shared<serial_disposable>();
    subscriber<T> s;
    s.on_subscribe = [slot](const flow_subscription_ptr& fs) {
      slot->replace(make_disposable([fs] { fs->cancel(); }));
      fs->request(unbounded);
    };
    s.on_next      = std::move(on_next);
    s.on_error     = std::move(on_err);
    s.on_completed = std::move(on_done);
    subscribe(std::move(s));
    return subscription(disposable_ptr(slot));
  }

  // Drops backpressure: requests unbounded and forwards as an observable.
  observable<T> to_observable() const {
    auto self = *this;
    return observable<T>::make([self](observer<T> o) {
      subscriber<T> s;
      s.on_subscribe = [o](const flow_subscription_ptr& fs) {
        o.subscribe(make_disposable([fs] { fs->cancel(); }));
        fs->request(unbounded);
      };
      s.on_next      = [o](const T& v) { o.next(v); };
      s.on_error     = [o](std::exception_ptr e) { o.error(std::move(e)); };
      s.on_completed = [o] { o.completed(); };
      self.subscribe(std::move(s));
    });
  }

private:
  explicit flowable(source_fn fn) : source_(std::move(fn)) {}

  source_fn source_;
};

// Puts a push source behind the demand protocol.
template <class T>
flowable<T> to_flowable(const observable<T>& src,
                        backpressure_strategy strategy,
                        std::size_t capacity = default_buffer_size) {
  return flowable<T>::create([src](flowable_emitter<T> em) {
    observer<T> o;
    o.on_subscribe = [em](const disposable_ptr& d) { em.set_disposable(d); };
    o.on_next      = [em](const T& v) { em.on_next(v); };
    o.on_error     = [em](std::exception_ptr e) { em.on_error(std::move(e)); };
    o.on_completed = [em] { em.on_completed(); };
    // the emitter owns the upstream handle from here on
    src.subscribe(std::move(o)).release();
  }, strategy, capacity);
}

struct op_to_flowable {
  backpressure_strategy strategy;
  std::size_t capacity;

  template <class T>
  flowable<T> operator()(const observable<T>& src) const { return to_flowable(src, strategy, capacity); }
};

inline auto to_flowable(backpressure_strategy strategy, std::size_t capacity = default_buffer_size) {
  return op_to_flowable{strategy, capacity};
}

} // namespace surge
