#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <surge/core/composite_disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/terminal_gate.hpp>

namespace surge {

namespace detail {

template <class X>
struct observable_value;

template <class T>
struct observable_value<observable<T>> {
  using type = T;
};

// Shared coordination of flat_map / merge / merge_all.
// active starts at 1 for the outer source; every inner source adds one
// before it is subscribed. Values go straight downstream while the gate is
// open; the first error or the last completion closes it.
template <class T>
class merge_state : public std::enable_shared_from_this<merge_state<T>> {
public:
  explicit merge_state(observer<T> down) : down_(std::move(down)) {}

  const std::shared_ptr<composite_disposable>& disposables() const noexcept { return set_; }

  bool is_active() const noexcept { return gate_.is_active(); }

  void subscribe_inner(const observable<T>& inner) {
    if (!gate_.is_active()) return;
    active_.fetch_add(1, std::memory_order_acq_rel);
    auto self = this->shared_from_this();
    // filled by on_subscribe, which runs before the inner source emits
    auto handle = std::make_shared<disposable_ptr>();

    observer<T> o;
    o.on_subscribe = [self, handle](const disposable_ptr& d) {
      *handle = d;
      self->set_->add(d);
    };
    o.on_next      = [self](const T& v) { self->next(v); };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self, handle] {
      if (*handle) self->set_->remove(*handle);
      self->source_done();
    };
    // the handle lives in the composite; dropping the subscription must not dispose it
    inner.subscribe(std::move(o)).release();
  }

  // Outer observer: on_next is supplied by the caller.
  template <class U>
  observer<U> outer_observer() {
    auto self = this->shared_from_this();
    observer<U> o;
    o.on_subscribe = [self](const disposable_ptr& d) { self->set_->add(d); };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self] { self->source_done(); };
    return o;
  }

  void next(const T& v) {
    if (!gate_.is_active()) return;
    down_.next(v);
  }

  void error(std::exception_ptr e) {
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    set_->dispose();
    down_.error(std::move(e));
    gate_.mark_terminated();
  }

  // Outer completion, or completion of one inner source.
  void source_done() {
    if (active_.fetch_sub(1, std::memory_order_acq_rel) != 1) return;
    if (!gate_.try_terminate()) return;
    set_->dispose();
    down_.completed();
    gate_.mark_terminated();
  }

private:
  observer<T> down_;
  std::atomic<int> active_{1};
  terminal_gate gate_;
  std::shared_ptr<composite_disposable> set_ = std::make_shared<composite_disposable>();
};

} // namespace detail

// flat_map(fn): maps every value to an observable and merges all of them.
// Completes once the outer source and every inner source completed; the
// first error (outer, inner, or thrown by fn) wins and cancels everything.
template <class F>
struct op_flat_map {
  F fn;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using inner_t = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using R = typename detail::observable_value<inner_t>::type;

    return observable<R>::make([src, fn = fn](observer<R> o) {
      auto st = std::make_shared<detail::merge_state<R>>(o);
      o.subscribe(st->disposables());

      auto outer = st->template outer_observer<T>();
      outer.on_next = [st, fn](const T& v) {
        if (!st->is_active()) return;
        std::optional<inner_t> inner;
        try {
          inner.emplace(fn(v));
        } catch (...) {
          st->error(std::current_exception());
          return;
        }
        st->subscribe_inner(*inner);
      };
      src.subscribe(std::move(outer)).release();
    });
  }
};

template <class F>
inline auto flat_map(F fn) { return op_flat_map<F>{ std::move(fn) }; }

// merge_all(): flattens an observable of observables.
struct op_merge_all {
  template <class T>
  observable<T> operator()(const observable<observable<T>>& src) const {
    return flat_map([](const observable<T>& inner) { return inner; })(src);
  }
};

inline auto merge_all() { return op_merge_all{}; }

template <class T>
inline observable<T> merge_all(const observable<observable<T>>& src) { return op_merge_all{}(src); }

} // namespace surge
