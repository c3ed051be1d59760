#pragma once
#include <atomic>
#include <deque>
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

// Inner sources run one after another in arrival order; the ones waiting
// for their turn are queued. drain() starts the next inner once the current
// one completed. It is a work-in-progress loop, so an inner that completes
// synchronously while being subscribed does not recurse.
template <class T>
class concat_state : public std::enable_shared_from_this<concat_state<T>> {
public:
  explicit concat_state(observer<T> down) : down_(std::move(down)) {
    set_->add(inner_);
  }

  const std::shared_ptr<composite_disposable>& disposables() const noexcept { return set_; }

  bool is_active() const noexcept { return gate_.is_active(); }

  void enqueue(observable<T> inner) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!gate_.is_active()) return;
      queue_.push_back(std::move(inner));
    }
    drain();
  }

  template <class U>
  observer<U> outer_observer() {
    auto self = this->shared_from_this();
    observer<U> o;
    o.on_subscribe = [self](const disposable_ptr& d) { self->set_->add(d); };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self] {
      {
        std::lock_guard<std::mutex> lock(self->m_);
        self->outer_done_ = true;
      }
      self->drain();
    };
    return o;
  }

  void error(std::exception_ptr e) {
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    set_->dispose();
    {
      std::lock_guard<std::mutex> lock(m_);
      queue_.clear();
    }
    down_.error(std::move(e));
    gate_.mark_terminated();
  }

private:
  void drain() {
    if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) return;
    int missed = 1;
    for (;;) {
      for (;;) {
        std::optional<observable<T>> next;
        bool finished = false;
        {
          std::lock_guard<std::mutex> lock(m_);
          if (!gate_.is_active()) {
            queue_.clear();
            return;
          }
          if (inner_live_) break;
          if (!queue_.empty()) {
            next.emplace(std::move(queue_.front()));
            queue_.pop_front();
            inner_live_ = true;
          } else if (outer_done_) {
            finished = true;
          } else {
            break;
          }
        }
        if (finished) {
          complete();
          return;
        }
        subscribe_inner(*next);
      }
      missed = wip_.fetch_sub(missed, std::memory_order_acq_rel) - missed;
      if (missed == 0) return;
    }
  }

  void subscribe_inner(const observable<T>& inner) {
    auto self = this->shared_from_this();
    observer<T> o;
    // replaces the handle of the inner that just completed
    o.on_subscribe = [self](const disposable_ptr& d) { self->inner_->set(d); };
    o.on_next = [self](const T& v) {
      if (self->gate_.is_active()) self->down_.next(v);
    };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self] {
      {
        std::lock_guard<std::mutex> lock(self->m_);
        self->inner_live_ = false;
      }
      self->drain();
    };
    inner.subscribe(std::move(o)).release();
  }

  void complete() {
    if (!gate_.try_terminate()) return;
    set_->dispose();
    down_.completed();
    gate_.mark_terminated();
  }

  observer<T> down_;
  std::mutex m_;
  std::deque<observable<T>> queue_;
  bool inner_live_{false};
  bool outer_done_{false};
  std::atomic<int> wip_{0};
  terminal_gate gate_;
  std::shared_ptr<serial_disposable> inner_ = std::make_shared<serial_disposable>();
  std::shared_ptr<composite_disposable> set_ = std::make_shared<composite_disposable>();
};

} // namespace detail

// concat_map(fn): maps every value to an observable and emits the inner
// sources one at a time, in the order of the outer values. Completes after
// the outer source and the last inner source completed.
template <class F>
struct op_concat_map {
  F fn;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using inner_t = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    using R = typename detail::observable_value<inner_t>::type;

    return observable<R>::make([src, fn = fn](observer<R> o) {
      auto st = std::make_shared<detail::concat_state<R>>(o);
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
        st->enqueue(std::move(*inner));
      };
      src.subscribe(std::move(outer)).release();
    });
  }
};

template <class F>
inline auto concat_map(F fn) { return op_concat_map<F>{ std::move(fn) }; }

} // namespace surge
