#pragma once
#include <exception>
#include <memory>
#include <utility>

#include <surge/core/null_check.hpp>
#include <surge/core/observer.hpp>
#include <surge/subjects/detail/subject_core.hpp>
#include <surge/subjects/detail/subject_slot.hpp>

namespace surge {

namespace detail {

template <class T>
struct publish_state : subject_core<T, subject_slot<T>> {
  using slot = subject_slot<T>;

  void subscribe(observer<T> o) {
    auto s = std::make_shared<slot>(std::move(o), this->observers);
    s->downstream().subscribe(s);
    if (this->observers->add(s)) {
      // cancelled from inside on_subscribe
      if (s->is_disposed()) this->observers->remove(s.get());
      return;
    }
    // late subscriber: only the terminal event
    this->deliver_terminal(*s);
  }

  void on_next(const T& v) {
    if (is_null_value(v)) {
      on_error(null_value_error());
      return;
    }
    if (!this->gate.is_active()) return;
    auto snap = this->observers->current();
    for (const auto& s : *snap) s->next(v);
  }

  void on_error(std::exception_ptr e) {
    if (!this->begin_error(std::move(e))) return;
    auto snap = this->observers->terminate();
    for (const auto& s : *snap) s->error(this->error);
    this->gate.mark_terminated();
  }

  void on_completed() {
    if (!this->begin_complete()) return;
    auto snap = this->observers->terminate();
    for (const auto& s : *snap) s->completed();
    this->gate.mark_terminated();
  }
};

} // namespace detail

// Hot multicast: subscribers get what is emitted after they subscribed.
// After termination new subscribers get only the terminal event.
template <class T>
class publish_subject : public detail::subject_base<T, detail::publish_state<T>> {
public:
  publish_subject() = default;

  static publish_subject create() { return publish_subject(); }
};

} // namespace surge
