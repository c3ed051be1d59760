#pragma once
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <vector>

#include <surge/core/disposable.hpp>

namespace surge {

// Set of disposables cancelled together.
// add() and remove() may race with dispose(): anything added after the
// cascade started is disposed on the spot, removals after it are no-ops.
class composite_disposable final : public disposable {
public:
  composite_disposable() = default;

  // Returns false (and disposes d) when the composite is already disposed.
  bool add(disposable_ptr d) {
    if (!d) return false;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_) {
        items_.push_back(std::move(d));
        return true;
      }
    }
    d->dispose();
    return false;
  }

  // Forgets d without disposing it.
  bool remove(const disposable_ptr& d) {
    std::lock_guard<std::mutex> lock(m_);
    if (disposed_) return false;
    auto it = std::find(items_.begin(), items_.end(), d);
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
  }

  void dispose() noexcept override {
    std::vector<disposable_ptr> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (disposed_) return;
      disposed_ = true;
      local.swap(items_);
    }
    for (auto& d : local) d->dispose();
  }

  bool is_disposed() const noexcept override {
    std::lock_guard<std::mutex> lock(m_);
    return disposed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return items_.size();
  }

  composite_disposable(const composite_disposable&)            = delete;
  composite_disposable& operator=(const composite_disposable&) = delete;

  composite_disposable(composite_disposable&&)            = delete;
  composite_disposable& operator=(composite_disposable&&) = delete;

private:
  mutable std::mutex m_;
  bool disposed_{false};
  std::vector<disposable_ptr> items_;
};

} // namespace surge
