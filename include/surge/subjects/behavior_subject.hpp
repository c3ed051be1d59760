#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <surge/core/null_check.hpp>
#include <surge/core/observer.hpp>
#include <surge/subjects/detail/subject_core.hpp>
#include <surge/subjects/detail/subject_slot.hpp>

namespace surge {

namespace detail {

// Current value tagged with the emission that produced it.
template <class T>
struct versioned {
  std::uint64_t index;
  T value;
};

template <class T>
using versioned_cell = std::atomic<std::shared_ptr<const versioned<T>>>;

// Subscriber of a behavior subject.
// The first delivery (current value) races with live emissions; until the
// slot has seen its first event, live events go through a mutex and are
// queued while the initial value is being delivered. Events whose index is
// not newer than the initial value are dropped. After that the slot switches
// to a lock-free fast path.
template <class T>
class behavior_slot final : public slot_base<T, behavior_slot<T>> {
public:
  struct event {
    std::optional<T> value;
    std::exception_ptr error;   // set: error terminal; value empty and no error: completion
  };

  using slot_base<T, behavior_slot<T>>::slot_base;

  void emit_first(const versioned_cell<T>& cell) {
    std::shared_ptr<const versioned<T>> cur;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (this->is_disposed() || next_seen_) return;
      cur = cell.load();
      index_ = cur ? cur->index : 0;
      emitting_ = static_cast<bool>(cur);
      next_seen_ = true;
    }
    if (!cur) return;
    this->next(cur->value);
    emit_loop();
  }

  void emit_next(const event& ev, std::uint64_t index) {
    if (this->is_disposed()) return;
    if (!fast_path_.load(std::memory_order_acquire)) {
      {
        std::lock_guard<std::mutex> lock(m_);
        if (this->is_disposed() || index <= index_) return;
        if (emitting_) {
          queue_.push_back(ev);
          return;
        }
        next_seen_ = true;
      }
      fast_path_.store(true, std::memory_order_release);
    }
    deliver(ev);
  }

private:
  void emit_loop() {
    for (;;) {
      std::vector<event> batch;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (queue_.empty()) {
          emitting_ = false;
          return;
        }
        batch.swap(queue_);
      }
      for (const auto& ev : batch) {
        if (deliver(ev)) return;
      }
    }
  }

  // Returns true when nothing more can be delivered.
  bool deliver(const event& ev) {
    if (ev.value) {
      this->next(*ev.value);
      return this->is_disposed();
    }
    if (ev.error) this->error(ev.error);
    else this->completed();
    return true;
  }

  std::mutex m_;
  bool emitting_{false};
  bool next_seen_{false};
  std::uint64_t index_{0};
  std::vector<event> queue_;
  std::atomic<bool> fast_path_{false};
};

template <class T>
struct behavior_state : subject_core<T, behavior_slot<T>> {
  using slot  = behavior_slot<T>;
  using event = typename slot::event;

  behavior_state() = default;
  explicit behavior_state(const T& initial) {
    if (is_null_value(initial)) throw protocol_violation("behavior_subject initial value is null");
    current.store(std::make_shared<const versioned<T>>(versioned<T>{0, initial}),
                  std::memory_order_release);
  }

  void subscribe(observer<T> o) {
    auto s = std::make_shared<slot>(std::move(o), this->observers);
    s->downstream().subscribe(s);
    if (this->observers->add(s)) {
      if (s->is_disposed()) {
        this->observers->remove(s.get());
        return;
      }
      s->emit_first(current);
      return;
    }
    // terminated: last value (if any), then the terminal event
    if (auto cur = current.load(std::memory_order_acquire)) s->next(cur->value);
    this->deliver_terminal(*s);
  }

  void on_next(const T& v) {
    if (is_null_value(v)) {
      on_error(null_value_error());
      return;
    }
    if (!this->gate.is_active()) return;
    auto idx = version.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto fresh = std::make_shared<const versioned<T>>(versioned<T>{idx, v});
    // concurrent producers: the newest index wins the cell
    auto cur = current.load();
    while (!cur || cur->index < idx) {
      if (current.compare_exchange_weak(cur, fresh)) break;
    }
    event ev{v, nullptr};
    auto snap = this->observers->current();
    for (const auto& s : *snap) s->emit_next(ev, idx);
  }

  void on_error(std::exception_ptr e) {
    if (!this->begin_error(std::move(e))) return;
    terminate(event{std::nullopt, this->error});
  }

  void on_completed() {
    if (!this->begin_complete()) return;
    terminate(event{std::nullopt, nullptr});
  }

  std::optional<T> value() const {
    if (auto cur = current.load(std::memory_order_acquire)) return cur->value;
    return std::nullopt;
  }

  versioned_cell<T> current;
  std::atomic<std::uint64_t> version{0};

private:
  void terminate(const event& ev) {
    auto idx = version.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto snap = this->observers->terminate();
    for (const auto& s : *snap) s->emit_next(ev, idx);
    this->gate.mark_terminated();
  }
};

} // namespace detail

// Hot multicast that remembers the most recent value.
// A new subscriber first receives the current value (if there is one), then
// everything emitted afterwards. After termination a new subscriber receives
// the last value, if any, followed by the terminal event.
template <class T>
class behavior_subject : public detail::subject_base<T, detail::behavior_state<T>> {
  using base = detail::subject_base<T, detail::behavior_state<T>>;

public:
  behavior_subject() = default;
  explicit behavior_subject(const T& initial)
    : base(std::make_shared<detail::behavior_state<T>>(initial)) {}

  static behavior_subject create() { return behavior_subject(); }
  static behavior_subject create_default(const T& initial) { return behavior_subject(initial); }

  bool has_value() const { return this->st_->current.load(std::memory_order_acquire) != nullptr; }
  std::optional<T> value() const { return this->st_->value(); }
};

} // namespace surge
