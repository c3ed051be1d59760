#pragma once
#include <concepts>
#include <type_traits>
#include <utility>

namespace surge {

// source | op  ==  op(source). Operators are callables taking the upstream
// observable (or flowable) and returning the composed one.
template <class Source, class Op>
  requires std::invocable<Op, Source>
auto operator|(Source&& src, Op&& op) -> std::invoke_result_t<Op, Source> {
  return std::forward<Op>(op)(std::forward<Source>(src));
}

} // namespace surge
