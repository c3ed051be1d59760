#pragma once
#include <memory>
#include <utility>
#include <vector>

#include <surge/core/observable.hpp>
#include <surge/ops/flat_map.hpp>

namespace surge {

// merge(sources): subscribes to every source and forwards values as they
// arrive. Completes when all sources completed; the first error cancels the rest.
template <class T>
inline observable<T> merge(std::vector<observable<T>> sources) {
  auto srcs = std::make_shared<const std::vector<observable<T>>>(std::move(sources));
  return observable<T>::make([srcs](observer<T> o) {
    auto st = std::make_shared<detail::merge_state<T>>(o);
    o.subscribe(st->disposables());
    for (const auto& s : *srcs) {
      if (!st->is_active()) break;
      st->subscribe_inner(s);
    }
    // releases the slot held for the "outer" side
    st->source_done();
  });
}

// merge(a, b, c, ...)
template <class T, class... Rest>
inline observable<T> merge(const observable<T>& a, const observable<T>& b, const Rest&... rest) {
  return merge<T>(std::vector<observable<T>>{ a, b, observable<T>(rest)... });
}

// Pipeline form: src | merge_with(other)
template <class T>
struct op_merge_with {
  observable<T> other;

  observable<T> operator()(const observable<T>& src) const { return merge<T>(src, other); }
};

template <class T>
inline auto merge_with(observable<T> other) { return op_merge_with<T>{ std::move(other) }; }

} // namespace surge
