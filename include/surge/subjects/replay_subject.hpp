#pragma once
#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <surge/core/null_check.hpp>
#include <surge/core/observer.hpp>
#include <surge/subjects/detail/replay_buffer.hpp>
#include <surge/subjects/detail/subject_core.hpp>
#include <surge/subjects/detail/subject_slot.hpp>

namespace surge {

namespace detail {

template <class T>
struct replay_state;

// Subscriber of a replay subject: a cursor into the history plus a
// work-in-progress counter so that only one thread drains it at a time.
template <class T>
class replay_slot final : public slot_base<T, replay_slot<T>> {
public:
  using node_ptr = typename replay_buffer<T>::node_ptr;

  replay_slot(observer<T> down, std::weak_ptr<observer_registry<replay_slot>> owner, node_ptr start)
    : slot_base<T, replay_slot<T>>(std::move(down), std::move(owner)), cursor_(std::move(start)) {}

  void replay(const replay_state<T>& st) {
    if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) return;
    int missed = 1;
    for (;;) {
      if (this->is_disposed()) {
        cursor_.reset();
        return;
      }
      auto n = cursor_->next.load();
      while (n) {
        if (this->is_disposed()) {
          cursor_.reset();
          return;
        }
        this->next(*n->value);
        cursor_ = std::move(n);
        n = cursor_->next.load();
      }
      if (st.outcome() != terminal_kind::none) {
        // items appended before the terminal may have landed meanwhile
        if (!cursor_->next.load()) {
          cursor_.reset();
          st.deliver_terminal(*this);
          return;
        }
        continue;
      }
      missed = wip_.fetch_sub(missed, std::memory_order_acq_rel) - missed;
      if (missed == 0) return;
    }
  }

private:
  std::atomic<int> wip_{0};
  node_ptr cursor_;
};

template <class T>
struct replay_state : subject_core<T, replay_slot<T>> {
  using slot = replay_slot<T>;

  explicit replay_state(std::size_t capacity) : buffer(capacity) {}

  void subscribe(observer<T> o) {
    auto s = std::make_shared<slot>(std::move(o), this->observers, buffer.head());
    s->downstream().subscribe(s);
    if (this->observers->add(s) && s->is_disposed()) {
      this->observers->remove(s.get());
      return;
    }
    // registered or not, the history is replayed; a closed registry only
    // means the terminal event follows it
    s->replay(*this);
  }

  void on_next(const T& v) {
    if (is_null_value(v)) {
      on_error(null_value_error());
      return;
    }
    if (!this->gate.is_active()) return;
    buffer.add(v);
    auto snap = this->observers->current();
    for (const auto& s : *snap) s->replay(*this);
  }

  void on_error(std::exception_ptr e) {
    if (!this->begin_error(std::move(e))) return;
    finish();
  }

  void on_completed() {
    if (!this->begin_complete()) return;
    finish();
  }

  replay_buffer<T> buffer;

private:
  void finish() {
    auto snap = this->observers->terminate();
    for (const auto& s : *snap) s->replay(*this);
    this->gate.mark_terminated();
  }
};

} // namespace detail

// Hot multicast with history. Every subscriber, early or late, receives the
// retained items in order and then continues live; after termination the
// retained items are followed by the terminal event.
template <class T>
class replay_subject : public detail::subject_base<T, detail::replay_state<T>> {
  using base = detail::subject_base<T, detail::replay_state<T>>;

public:
  // Unbounded history.
  replay_subject() : base(std::make_shared<detail::replay_state<T>>(0)) {}

  static replay_subject create() { return replay_subject(); }

  // Keeps only the most recent max_size items.
  static replay_subject with_size(std::size_t max_size) {
    if (max_size == 0) throw std::invalid_argument("replay_subject: max_size must be > 0");
    return replay_subject(max_size);
  }

  std::vector<T> values() const { return this->st_->buffer.values(); }
  std::size_t size() const { return this->st_->buffer.size(); }
  bool has_value() const { return size() > 0; }

private:
  explicit replay_subject(std::size_t capacity)
    : base(std::make_shared<detail::replay_state<T>>(capacity)) {}
};

} // namespace surge
