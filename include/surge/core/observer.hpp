#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <surge/core/disposable.hpp>

namespace surge {

// Callback set receiving one execution.
// Contract: on_subscribe first and once, then any number of on_next, then at
// most one of on_error / on_completed. Every callback is optional.
template <class T>
struct observer {
  using value_type  = T;
  using OnSubscribe = std::function<void(const disposable_ptr&)>;
  using OnNext      = std::function<void(const T&)>;
  using OnErr       = std::function<void(std::exception_ptr)>;
  using OnDone      = std::function<void()>;

  OnSubscribe on_subscribe;
  OnNext      on_next;
  OnErr       on_error;
  OnDone      on_completed;

  void subscribe(const disposable_ptr& d) const { if (on_subscribe) on_subscribe(d); }
  void next(const T& v) const { if (on_next) on_next(v); }
  void error(std::exception_ptr e) const { if (on_error) on_error(std::move(e)); }
  void completed() const { if (on_completed) on_completed(); }
};

template <class T>
inline observer<T> make_observer(typename observer<T>::OnNext on_next,
                                 typename observer<T>::OnErr on_err = {},
                                 typename observer<T>::OnDone on_done = {},
                                 typename observer<T>::OnSubscribe on_sub = {}) {
  observer<T> o;
  o.on_subscribe = std::move(on_sub);
  o.on_next      = std::move(on_next);
  o.on_error     = std::move(on_err);
  o.on_completed = std::move(on_done);
  return o;
}

} // namespace surge
