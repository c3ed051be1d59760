#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/observer.hpp>
#include <surge/subjects/detail/observer_registry.hpp>

namespace surge {
namespace detail {

// One subscriber of a subject; also its cancellation handle.
// Disposing the slot unregisters it. Terminal delivery marks it disposed so
// that at most one terminal event reaches the observer.
template <class T, class Derived>
class slot_base : public disposable {
public:
  using registry = observer_registry<Derived>;

  slot_base(observer<T> down, std::weak_ptr<registry> owner)
    : down_(std::move(down)), owner_(std::move(owner)) {}

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;
    if (auto r = owner_.lock()) r->remove(static_cast<const Derived*>(this));
  }

  bool is_disposed() const noexcept override { return disposed_.load(std::memory_order_acquire); }

  void next(const T& v) const {
    if (!is_disposed()) down_.next(v);
  }

  void error(const std::exception_ptr& e) {
    if (!disposed_.exchange(true, std::memory_order_acq_rel)) down_.error(e);
  }

  void completed() {
    if (!disposed_.exchange(true, std::memory_order_acq_rel)) down_.completed();
  }

  const observer<T>& downstream() const noexcept { return down_; }

protected:
  observer<T> down_;
  std::weak_ptr<registry> owner_;
  std::atomic<bool> disposed_{false};
};

// Slot without extra per-subscriber state (publish, async).
template <class T>
class subject_slot final : public slot_base<T, subject_slot<T>> {
public:
  using slot_base<T, subject_slot<T>>::slot_base;
};

} // namespace detail
} // namespace surge
