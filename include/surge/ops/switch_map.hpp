#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include <surge/core/composite_disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/terminal_gate.hpp>
#include <surge/ops/flat_map.hpp>

namespace surge {

namespace detail {

// Only the newest inner source is live. Every outer value bumps index_ and
// cancels the previous inner; events tagged with an older index are stale
// and dropped. Completes once the outer source and the current inner are done.
template <class T>
class switch_state : public std::enable_shared_from_this<switch_state<T>> {
public:
  explicit switch_state(observer<T> down) : down_(std::move(down)) {
    set_->add(inner_);
  }

  const std::shared_ptr<composite_disposable>& disposables() const noexcept { return set_; }

  bool is_active() const noexcept { return gate_.is_active(); }

  void switch_to(const observable<T>& inner) {
    if (!gate_.is_active()) return;
    std::uint64_t id;
    {
      std::lock_guard<std::mutex> lock(m_);
      id = index_.load(std::memory_order_relaxed) + 1;
      index_.store(id, std::memory_order_release);
      inner_live_ = true;
    }
    // cancels the previous inner; the placeholder is swapped out by on_subscribe
    inner_->set(empty_disposable());

    auto self = this->shared_from_this();
    observer<T> o;
    o.on_subscribe = [self, id](const disposable_ptr& d) { self->attach(id, d); };
    o.on_next = [self, id](const T& v) {
      if (self->is_current(id) && self->gate_.is_active()) self->down_.next(v);
    };
    o.on_error = [self, id](std::exception_ptr e) {
      if (self->is_current(id)) self->error(std::move(e));
      else plugins::on_error(e);
    };
    o.on_completed = [self, id] { self->inner_done(id); };
    inner.subscribe(std::move(o)).release();
  }

  template <class U>
  observer<U> outer_observer() {
    auto self = this->shared_from_this();
    observer<U> o;
    o.on_subscribe = [self](const disposable_ptr& d) { self->set_->add(d); };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self] { self->outer_done(); };
    return o;
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

private:
  bool is_current(std::uint64_t id) const noexcept {
    return index_.load(std::memory_order_acquire) == id;
  }

  void attach(std::uint64_t id, const disposable_ptr& d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (index_.load(std::memory_order_relaxed) == id) {
        inner_->set(d);
        return;
      }
    }
    d->dispose();
  }

  void inner_done(std::uint64_t id) {
    bool finish = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (index_.load(std::memory_order_relaxed) != id) return;
      inner_live_ = false;
      finish = outer_done_;
    }
    if (finish) complete();
  }

  void outer_done() {
    bool finish = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      outer_done_ = true;
      finish = !inner_live_;
    }
    if (finish) complete();
  }

  void complete() {
    if (!gate_.try_terminate()) return;
    set_->dispose();
    down_.completed();
    gate_.mark_terminated();
  }

  observer<T> down_;
  std::mutex m_;
  std::atomic<std::uint64_t> index_{0};
  bool inner_live_{false};
  bool outer_done_{false};
  terminal_gate gate_;
  std::shared_ptr<serial_disposable> inner_ = std::make_shared<serial_disposable>();
  std::shared_ptr<composite_disposable> set_ = std::make_shared<composite_disposable>();
};

} // namespace detail

// switch_map(fn): maps every value to an observable and mirrors only the
// most recent one; a new outer value cancels the inner source before it.
template <class F>
struct op_switch_map {
  F fn;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using inner_t = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using R = typename detail::observable_value<inner_t>::type;

    return observable<R>::make([src, fn = fn](observer<R> o) {
      auto st = std::make_shared<detail::switch_state<R>>(o);
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
        st->switch_to(*inner);
      };
      src.subscribe(std::move(outer)).release();
    });
  }
};

template <class F>
inline auto switch_map(F fn) { return op_switch_map<F>{ std::move(fn) }; }

} // namespace surge
