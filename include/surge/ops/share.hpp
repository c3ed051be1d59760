#pragma once
#include <chrono>

#include <surge/core/observable.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/ops/publish.hpp>

namespace surge {

// share(): one upstream -> many downstreams; the upstream runs while there are subscribers.
// After the source terminated, or everybody left, the next subscriber starts a
// fresh execution.
template <class T>
inline observable<T> share(const observable<T>& src) {
  return ref_count(publish(src));
}

// share(src, grace, sch): as above, but the upstream survives a gap of up to grace
template <class T, class Rep, class Period>
inline observable<T> share(const observable<T>& src,
                           std::chrono::duration<Rep, Period> grace,
                           scheduler& sch) {
  return ref_count(publish(src), grace, sch);
}

struct op_share {
  template <class T>
  observable<T> operator()(const observable<T>& src) const { return share(src); }
};

inline auto share() { return op_share{}; }

} // namespace surge
