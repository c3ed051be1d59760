#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include <surge/core/null_check.hpp>
#include <surge/core/observer.hpp>
#include <surge/subjects/detail/subject_core.hpp>
#include <surge/subjects/detail/subject_slot.hpp>

namespace surge {

namespace detail {

template <class T>
struct async_state : subject_core<T, subject_slot<T>> {
  using slot = subject_slot<T>;

  void subscribe(observer<T> o) {
    auto s = std::make_shared<slot>(std::move(o), this->observers);
    s->downstream().subscribe(s);
    if (this->observers->add(s)) {
      if (s->is_disposed()) this->observers->remove(s.get());
      return;
    }
    deliver_outcome(*s);
  }

  void on_next(const T& v) {
    if (is_null_value(v)) {
      on_error(null_value_error());
      return;
    }
    if (!this->gate.is_active()) return;
    last.store(std::make_shared<const T>(v), std::memory_order_release);
  }

  void on_error(std::exception_ptr e) {
    if (!this->begin_error(std::move(e))) return;
    // an errored async subject has no value to offer
    last.store(nullptr, std::memory_order_release);
    finish();
  }

  void on_completed() {
    if (!this->begin_complete()) return;
    finish();
  }

  // Completion: last value (if any) then on_completed. Error: the error only.
  void deliver_outcome(slot& s) const {
    if (this->outcome() == terminal_kind::completed) {
      if (auto v = last.load(std::memory_order_acquire)) s.next(*v);
    }
    this->deliver_terminal(s);
  }

  std::atomic<std::shared_ptr<const T>> last;

private:
  void finish() {
    auto snap = this->observers->terminate();
    for (const auto& s : *snap) deliver_outcome(*s);
    this->gate.mark_terminated();
  }
};

} // namespace detail

// Emits only the final value, and only on successful completion.
// Subscribers before and after termination see the same outcome.
template <class T>
class async_subject : public detail::subject_base<T, detail::async_state<T>> {
public:
  async_subject() = default;

  static async_subject create() { return async_subject(); }

  // Final value; available once the subject completed.
  bool has_value() const {
    return this->has_complete() && this->st_->last.load(std::memory_order_acquire) != nullptr;
  }

  std::optional<T> value() const {
    if (!this->has_complete()) return std::nullopt;
    if (auto v = this->st_->last.load(std::memory_order_acquire)) return *v;
    return std::nullopt;
  }
};

} // namespace surge
