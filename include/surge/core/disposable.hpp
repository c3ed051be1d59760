#pragma once
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

#include <surge/core/plugins.hpp>

namespace surge {

// Cancellation token of one execution.
// dispose() is idempotent; is_disposed() reports that cancellation was requested,
// not that the producer has already stopped.
class disposable {
public:
  virtual ~disposable() = default;
  virtual void dispose() noexcept = 0;
  virtual bool is_disposed() const noexcept = 0;
};

using disposable_ptr = std::shared_ptr<disposable>;

// Flag only.
class boolean_disposable final : public disposable {
public:
  void dispose() noexcept override { disposed_.store(true, std::memory_order_release); }
  bool is_disposed() const noexcept override { return disposed_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> disposed_{false};
};

// Runs the action exactly once, on the first dispose().
class action_disposable final : public disposable {
public:
  explicit action_disposable(std::function<void()> fn) : fn_(std::move(fn)) {}

  void dispose() noexcept override {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) return;
    auto fn = std::move(fn_);
    fn_ = nullptr;
    if (!fn) return;
    try {
      fn();
    } catch (...) {
      plugins::on_error(std::current_exception());
    }
  }

  bool is_disposed() const noexcept override { return disposed_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> disposed_{false};
  std::function<void()> fn_;
};

// Holds one replaceable upstream handle.
// A handle arriving after dispose() is disposed immediately.
class serial_disposable final : public disposable {
public:
  serial_disposable() = default;
  explicit serial_disposable(disposable_ptr d) : cur_(std::move(d)) {}

  // Installs d and disposes the previous handle.
  bool set(disposable_ptr d) {
    disposable_ptr prev;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_.load(std::memory_order_relaxed)) {
        prev = std::exchange(cur_, std::move(d));
        d = nullptr;
      }
    }
    if (d) { d->dispose(); return false; }
    if (prev) prev->dispose();
    return true;
  }

  // Installs d without touching the previous handle.
  bool replace(disposable_ptr d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_.load(std::memory_order_relaxed)) {
        cur_ = std::move(d);
        return true;
      }
    }
    if (d) d->dispose();
    return false;
  }

  disposable_ptr get() const {
    std::lock_guard<std::mutex> lock(m_);
    return cur_;
  }

  void dispose() noexcept override {
    disposable_ptr d;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (disposed_.load(std::memory_order_relaxed)) return;
      disposed_.store(true, std::memory_order_release);
      d = std::move(cur_);
    }
    if (d) d->dispose();
  }

  // Lock-free: read on every event by the contract guard.
  bool is_disposed() const noexcept override { return disposed_.load(std::memory_order_acquire); }

private:
  mutable std::mutex m_;
  std::atomic<bool> disposed_{false};
  disposable_ptr cur_;
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline disposable_ptr make_disposable(F&& f) {
  return std::make_shared<action_disposable>(std::function<void()>(std::forward<F>(f)));
}

// Fresh, not yet disposed token with no action.
inline disposable_ptr empty_disposable() {
  return std::make_shared<boolean_disposable>();
}

// Token that is already disposed.
inline disposable_ptr disposed() {
  auto d = std::make_shared<boolean_disposable>();
  d->dispose();
  return d;
}

} // namespace surge
