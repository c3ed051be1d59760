#pragma once
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <utility>

#include <surge/core/errors.hpp>

namespace surge {
namespace plugins {

// Receives errors that have nowhere else to go: the losers of a terminal race,
// on_error without an error callback, failures inside dispose actions.
using error_handler = std::function<void(std::exception_ptr)>;

namespace detail {
struct hooks {
  std::mutex m;
  error_handler on_error;
};

inline hooks& instance() {
  static hooks h;
  return h;
}
} // namespace detail

inline void set_error_handler(error_handler fn) {
  auto& h = detail::instance();
  std::lock_guard<std::mutex> lock(h.m);
  h.on_error = std::move(fn);
}

inline error_handler get_error_handler() {
  auto& h = detail::instance();
  std::lock_guard<std::mutex> lock(h.m);
  return h.on_error;
}

inline void reset() { set_error_handler(nullptr); }

// Routes an undeliverable error. Never throws.
inline void on_error(std::exception_ptr e) noexcept {
  error_handler fn = get_error_handler();
  if (fn) {
    try {
      fn(e);
      return;
    } catch (...) {
      std::cerr << "[surge] error handler threw: " << describe(std::current_exception()) << '\n';
    }
  }
  std::cerr << "[surge] undeliverable error: " << describe(e) << '\n';
}

} // namespace plugins
} // namespace surge
