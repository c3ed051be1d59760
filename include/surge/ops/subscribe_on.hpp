#pragma once
#include <memory>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/scheduler.hpp>

namespace surge {

// ================================
// subscribe_on(scheduler&)
// Moves the upstream subscription (and therefore a synchronous source's
// emissions) onto the scheduler. Disposing before the task ran cancels it.
// IMPORTANT: the scheduler must outlive the subscription!
// ================================
struct op_subscribe_on {
  scheduler* sch;

  template <class T>
  observable<T> operator()(const observable<T>& src) const {
    return observable<T>::make([src, sch = sch](observer<T> o) {
      auto up = std::make_shared<serial_disposable>();
      o.subscribe(up);

      sch->execute([src, o, up] {
        if (up->is_disposed()) return; // unsubscribed before the task ran
        observer<T> fwd = o;
        fwd.on_subscribe = [up](const disposable_ptr& d) { up->replace(d); };
        src.subscribe(std::move(fwd)).release();
      });
    });
  }
};

inline auto subscribe_on(scheduler& sch) { return op_subscribe_on{ &sch }; }

} // namespace surge
