#pragma once
#include <functional>
#include <memory>
#include <utility>

#include <surge/core/disposable.hpp>

namespace surge {

// RAII owner of an execution's disposable.
// - Copying is PROHIBITED (one subscription - one owner).
// - Moving is allowed: ownership is moved, the original object is reset.
// - By default, the destructor disposes (can be disabled with a flag).
class subscription {
public:
  using cancel_fn = std::function<void()>;

  // Creates an empty subscription.
  subscription() noexcept = default;

  // Construct from the cancel function.
  explicit subscription(cancel_fn fn, bool cancel_on_dtor = true)
    : d_(fn ? std::make_shared<action_disposable>(std::move(fn)) : nullptr)
    , cancel_on_dtor_(cancel_on_dtor) {}

  // Take shared ownership of an existing disposable.
  explicit subscription(disposable_ptr d, bool cancel_on_dtor = true) noexcept
    : d_(std::move(d)), cancel_on_dtor_(cancel_on_dtor) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : d_(std::move(other.d_))
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.d_ = nullptr;
    // the moved-from object must not dispose again from its destructor
    other.cancel_on_dtor_ = false;
  }

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      d_ = std::move(other.d_);
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.d_ = nullptr;
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subscription() {
    if (cancel_on_dtor_) reset();
  }

  // Disposes once. Repeated calls are no-op.
  void reset() noexcept {
    if (d_) {
      d_->dispose();
      d_ = nullptr;
    }
    cancel_on_dtor_ = false;
  }

  // Gives up ownership without disposing; the caller becomes responsible.
  disposable_ptr release() noexcept {
    cancel_on_dtor_ = false;
    return std::exchange(d_, nullptr);
  }

  // Shared view of the handle (ownership stays here).
  const disposable_ptr& get() const noexcept { return d_; }

  // True once cancellation was requested, or when there is nothing to cancel.
  bool is_disposed() const noexcept { return !d_ || d_->is_disposed(); }

  explicit operator bool() const noexcept { return static_cast<bool>(d_); }

private:
  disposable_ptr d_{};
  bool cancel_on_dtor_{true};
};

} // namespace surge
