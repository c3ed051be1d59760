#pragma once
#include <array>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include <surge/core/composite_disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/plugins.hpp>
#include <surge/core/terminal_gate.hpp>

namespace surge {

namespace detail {

// One FIFO queue per source. Every emission enqueues and then drains: while
// all queues hold an item, one row is taken and combined. The zip completes
// once every source has completed and no further row can form; whatever is
// left in the longer queues is dropped.
// Draining is serialized by the draining flag; an emission arriving while
// another thread drains just enqueues and the drainer picks it up.
template <class R, class F, class... Ts>
class zip_state : public std::enable_shared_from_this<zip_state<R, F, Ts...>> {
  static constexpr std::size_t N = sizeof...(Ts);

public:
  zip_state(observer<R> down, F f) : down_(std::move(down)), f_(std::move(f)) {}

  const std::shared_ptr<composite_disposable>& disposables() const noexcept { return set_; }

  void subscribe_all(const observable<Ts>&... srcs) {
    subscribe_each(std::index_sequence_for<Ts...>{}, srcs...);
  }

private:
  template <std::size_t... I>
  void subscribe_each(std::index_sequence<I...>, const observable<Ts>&... srcs) {
    (subscribe_one<I>(srcs), ...);
  }

  template <std::size_t I, class U>
  void subscribe_one(const observable<U>& src) {
    if (!gate_.is_active()) return;
    auto self = this->shared_from_this();
    observer<U> o;
    o.on_subscribe = [self](const disposable_ptr& d) { self->set_->add(d); };
    o.on_next      = [self](const U& v) { self->template push<I>(v); };
    o.on_error     = [self](std::exception_ptr e) { self->error(std::move(e)); };
    o.on_completed = [self] { self->template source_done<I>(); };
    src.subscribe(std::move(o)).release();
  }

  template <std::size_t I, class U>
  void push(const U& v) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!gate_.is_active()) return;
      std::get<I>(queues_).push_back(v);
    }
    drain();
  }

  template <std::size_t I>
  void source_done() {
    {
      std::lock_guard<std::mutex> lock(m_);
      done_[I] = true;
    }
    drain();
  }

  void error(std::exception_ptr e) {
    if (!gate_.try_terminate()) {
      plugins::on_error(e);
      return;
    }
    set_->dispose();
    clear();
    down_.error(std::move(e));
    gate_.mark_terminated();
  }

  void drain() {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (draining_) return;
      draining_ = true;
    }
    for (;;) {
      std::optional<std::tuple<Ts...>> row;
      bool finished = false;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (!gate_.is_active()) {
          draining_ = false;
          return;
        }
        if (all_ready(std::index_sequence_for<Ts...>{})) {
          row.emplace(pop_row(std::index_sequence_for<Ts...>{}));
        } else if (all_done()) {
          finished = true;
        } else {
          draining_ = false;
          return;
        }
      }
      if (finished) {
        complete();
        return;
      }
      std::optional<R> out;
      try {
        out.emplace(std::apply(f_, *row));
      } catch (...) {
        error(std::current_exception());
        return;
      }
      down_.next(*out);
    }
  }

  void complete() {
    if (!gate_.try_terminate()) return;
    set_->dispose();
    clear();
    down_.completed();
    gate_.mark_terminated();
  }

  template <std::size_t... I>
  bool all_ready(std::index_sequence<I...>) const {
    return (!std::get<I>(queues_).empty() && ...);
  }

  bool all_done() const {
    for (bool d : done_) {
      if (!d) return false;
    }
    return true;
  }

  template <std::size_t... I>
  std::tuple<Ts...> pop_row(std::index_sequence<I...>) {
    std::tuple<Ts...> row{ std::move(std::get<I>(queues_).front())... };
    (std::get<I>(queues_).pop_front(), ...);
    return row;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(m_);
    std::apply([](auto&... q) { (q.clear(), ...); }, queues_);
  }

  observer<R> down_;
  F f_;
  std::mutex m_;
  std::tuple<std::deque<Ts>...> queues_;
  std::array<bool, N> done_{};
  bool draining_{false};
  terminal_gate gate_;
  std::shared_ptr<composite_disposable> set_ = std::make_shared<composite_disposable>();
};

} // namespace detail

// zip_with(f, a, b, ...): emits f(a_i, b_i, ...) for the i-th value of every source.
// Completes after every source has completed; unmatched trailing values are dropped.
template <class F, class... Ts>
auto zip_with(F f, const observable<Ts>&... srcs) {
  static_assert(sizeof...(Ts) >= 2, "zip needs at least two sources");
  using R = std::decay_t<std::invoke_result_t<F&, const Ts&...>>;
  return observable<R>::make([f = std::move(f), srcs...](observer<R> o) {
    auto st = std::make_shared<detail::zip_state<R, F, Ts...>>(o, f);
    o.subscribe(st->disposables());
    st->subscribe_all(srcs...);
  });
}

// zip(oa, ob, f)
template <class A, class B, class F>
auto zip(const observable<A>& oa, const observable<B>& ob, F f) {
  return zip_with(std::move(f), oa, ob);
}

// zip(oa, ob, oc, f)
template <class A, class B, class C, class F>
auto zip(const observable<A>& oa, const observable<B>& ob, const observable<C>& oc, F f) {
  return zip_with(std::move(f), oa, ob, oc);
}

} // namespace surge
