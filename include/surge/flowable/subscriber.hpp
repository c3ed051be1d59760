#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <surge/flowable/flow_subscription.hpp>

namespace surge {

// Callback set of the backpressure protocol. Nothing is delivered until the
// subscriber asks for it through the subscription given to on_subscribe.
template <class T>
struct subscriber {
  using value_type  = T;
  using OnSubscribe = std::function<void(const flow_subscription_ptr&)>;
  using OnNext      = std::function<void(const T&)>;
  using OnErr       = std::function<void(std::exception_ptr)>;
  using OnDone      = std::function<void()>;

  OnSubscribe on_subscribe;
  OnNext      on_next;
  OnErr       on_error;
  OnDone      on_completed;

  void subscribe(const flow_subscription_ptr& s) const { if (on_subscribe) on_subscribe(s); }
  void next(const T& v) const { if (on_next) on_next(v); }
  void error(std::exception_ptr e) const { if (on_error) on_error(std::move(e)); }
  void completed() const { if (on_completed) on_completed(); }
};

template <class T>
inline subscriber<T> make_subscriber(typename subscriber<T>::OnSubscribe on_sub,
                                     typename subscriber<T>::OnNext on_next,
                                     typename subscriber<T>::OnErr on_err = {},
                                     typename subscriber<T>::OnDone on_done = {}) {
  subscriber<T> s;
  s.on_subscribe = std::move(on_sub);
  s.on_next      = std::move(on_next);
  s.on_error     = std::move(on_err);
  s.on_completed = std::move(on_done);
  return s;
}

} // namespace surge
