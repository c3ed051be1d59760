#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/errors.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/observer.hpp>
#include <surge/core/subscription.hpp>
#include <surge/core/terminal_gate.hpp>
#include <surge/subjects/detail/observer_registry.hpp>

namespace surge {
namespace detail {

enum class terminal_kind : int { none, completed, error };

inline std::exception_ptr null_value_error() {
  return std::make_exception_ptr(protocol_violation("on_next called with null"));
}

// State shared by every subject variant: subscriber registry plus the
// ACTIVE -> COMPLETE | ERROR transition. error is written before kind is
// published and kind before the registry is closed, so whoever finds the
// registry closed also sees the terminal outcome.
template <class T, class Slot>
struct subject_core {
  std::shared_ptr<observer_registry<Slot>> observers = std::make_shared<observer_registry<Slot>>();
  terminal_gate gate;
  std::exception_ptr error;
  std::atomic<terminal_kind> kind{terminal_kind::none};

  void on_subscribe(const disposable_ptr& d) const {
    if (d && gate.is_terminated()) d->dispose();
  }

  bool begin_error(std::exception_ptr e) {
    if (!e) e = std::make_exception_ptr(protocol_violation("on_error called with null"));
    if (!gate.try_terminate()) return false;
    error = std::move(e);
    kind.store(terminal_kind::error, std::memory_order_release);
    return true;
  }

  bool begin_complete() {
    if (!gate.try_terminate()) return false;
    kind.store(terminal_kind::completed, std::memory_order_release);
    return true;
  }

  terminal_kind outcome() const noexcept { return kind.load(std::memory_order_acquire); }

  // Delivers the stored terminal event to a slot that is not registered.
  template <class S>
  void deliver_terminal(S& s) const {
    if (outcome() == terminal_kind::error) s.error(error);
    else s.completed();
  }
};

// Public face shared by the four variants: a copyable handle to shared state.
// Copies refer to the same subject.
template <class T, class State>
class subject_base {
public:
  using value_type = T;
  using OnNext     = typename observer<T>::OnNext;
  using OnErr      = typename observer<T>::OnErr;
  using OnDone     = typename observer<T>::OnDone;

  // Subjects ignore upstream cancellation, except that an upstream arriving
  // after termination is disposed immediately.
  void on_subscribe(const disposable_ptr& d) { st_->on_subscribe(d); }

  void on_next(const T& v) { st_->on_next(v); }
  void on_error(std::exception_ptr e) { st_->on_error(std::move(e)); }
  void on_completed() { st_->on_completed(); }

  observable<T> as_observable() const {
    auto st = st_;
    return observable<T>::make([st](observer<T> o) { st->subscribe(std::move(o)); });
  }

  // Lets the subject be subscribed to an upstream: src.subscribe(s.as_observer()).
  observer<T> as_observer() const {
    auto st = st_;
    observer<T> o;
    o.on_subscribe = [st](const disposable_ptr& d) { st->on_subscribe(d); };
    o.on_next      = [st](const T& v) { st->on_next(v); };
    o.on_error     = [st](std::exception_ptr e) { st->on_error(std::move(e)); };
    o.on_completed = [st] { st->on_completed(); };
    return o;
  }

  subscription subscribe(observer<T> o) const { return as_observable().subscribe(std::move(o)); }

  subscription subscribe(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    return as_observable().subscribe(std::move(on_next), std::move(on_err), std::move(on_done));
  }

  bool has_observers() const { return st_->observers->size() > 0; }
  std::size_t observer_count() const { return st_->observers->size(); }

  bool has_complete() const { return st_->outcome() == terminal_kind::completed; }
  bool has_error() const { return st_->outcome() == terminal_kind::error; }
  bool has_terminated() const { return st_->outcome() != terminal_kind::none; }

  // Terminal error, or null while active / after completion.
  std::exception_ptr error() const {
    return st_->outcome() == terminal_kind::error ? st_->error : std::exception_ptr{};
  }

protected:
  subject_base() : st_(std::make_shared<State>()) {}
  explicit subject_base(std::shared_ptr<State> st) : st_(std::move(st)) {}

  std::shared_ptr<State> st_;
};

} // namespace detail
} // namespace surge
