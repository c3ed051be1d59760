#pragma once
#include <concepts>

namespace surge {
namespace detail {

// Value types that have an "empty marker" (raw and smart pointers).
template <class T>
concept nullable = requires(const T& v) {
  { v == nullptr } -> std::convertible_to<bool>;
};

template <class T>
constexpr bool is_null_value(const T& v) noexcept {
  if constexpr (nullable<T>) {
    return v == nullptr;
  } else {
    (void)v;
    return false;
  }
}

} // namespace detail
} // namespace surge
