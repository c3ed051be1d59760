#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace surge {
namespace detail {

// Copy-on-write set of subscriber slots.
// The current array is immutable; add/remove build a new array and swap it in
// with a CAS, emission walks one snapshot without any lock. A slot removed
// while an emission is in flight may still get that one event.
// terminate() swaps in a sentinel after which add() fails for good.
// Registry operations are sequentially consistent: a subscriber stores its
// slot and then reads the subject state, a producer stores the state and
// then reads the registry, and one of the two must see the other.
template <class Slot>
class observer_registry {
public:
  using array    = std::vector<std::shared_ptr<Slot>>;
  using snapshot = std::shared_ptr<const array>;

  observer_registry()
    : terminated_(std::make_shared<const array>())
    , cur_(std::make_shared<const array>()) {}

  observer_registry(const observer_registry&) = delete;
  observer_registry& operator=(const observer_registry&) = delete;

  bool add(const std::shared_ptr<Slot>& s) {
    snapshot cur = cur_.load();
    for (;;) {
      if (cur == terminated_) return false;
      auto next = std::make_shared<array>();
      next->reserve(cur->size() + 1);
      next->assign(cur->begin(), cur->end());
      next->push_back(s);
      if (cur_.compare_exchange_weak(cur, snapshot(std::move(next)))) {
        return true;
      }
    }
  }

  void remove(const Slot* s) {
    snapshot cur = cur_.load();
    for (;;) {
      if (cur == terminated_ || cur->empty()) return;
      auto it = std::find_if(cur->begin(), cur->end(),
                             [s](const std::shared_ptr<Slot>& p) { return p.get() == s; });
      if (it == cur->end()) return;

      auto next = std::make_shared<array>();
      next->reserve(cur->size() - 1);
      for (auto jt = cur->begin(); jt != cur->end(); ++jt) {
        if (jt != it) next->push_back(*jt);
      }
      if (cur_.compare_exchange_weak(cur, snapshot(std::move(next)))) {
        return;
      }
    }
  }

  snapshot current() const { return cur_.load(); }

  // Closes the registry and hands back the last set of subscribers.
  snapshot terminate() { return cur_.exchange(terminated_); }

  bool is_terminated() const { return cur_.load(std::memory_order_acquire) == terminated_; }

  std::size_t size() const { return cur_.load(std::memory_order_acquire)->size(); }

private:
  const snapshot terminated_;
  std::atomic<snapshot> cur_;
};

} // namespace detail
} // namespace surge
