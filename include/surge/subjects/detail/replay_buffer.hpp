#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace surge {
namespace detail {

// Link of the replay history. Readers hold a pointer to the last node they
// delivered and follow next; nodes trimmed from the head stay alive while a
// reader still points into them.
template <class T>
struct replay_node {
  replay_node() = default;
  replay_node(std::uint64_t i, const T& v) : index(i), value(v) {}

  // Unlinks the tail iteratively so a long chain does not recurse.
  ~replay_node() {
    auto n = next.exchange(nullptr, std::memory_order_acq_rel);
    while (n && n.use_count() == 1) {
      auto after = n->next.exchange(nullptr, std::memory_order_acq_rel);
      n = std::move(after);
    }
  }

  replay_node(const replay_node&) = delete;
  replay_node& operator=(const replay_node&) = delete;

  std::uint64_t index{0};
  std::optional<T> value;
  std::atomic<std::shared_ptr<replay_node>> next;
};

// Append-only history. capacity == 0 keeps everything, otherwise the oldest
// items are trimmed so that at most capacity remain reachable from head().
// Producers are serialized by an internal mutex; readers never lock.
template <class T>
class replay_buffer {
public:
  using node     = replay_node<T>;
  using node_ptr = std::shared_ptr<node>;

  explicit replay_buffer(std::size_t capacity)
    : capacity_(capacity), head_(std::make_shared<node>()) {
    tail_ = head_.load(std::memory_order_relaxed);
  }

  void add(const T& v) {
    std::lock_guard<std::mutex> lock(m_);
    auto n = std::make_shared<node>(++count_, v);
    tail_->next.store(n);
    tail_ = std::move(n);
    if (capacity_ != 0 && size_.load(std::memory_order_relaxed) == capacity_) {
      auto h = head_.load(std::memory_order_acquire);
      head_.store(h->next.load(std::memory_order_acquire), std::memory_order_release);
    } else {
      size_.fetch_add(1, std::memory_order_release);
    }
  }

  // Sentinel whose successor is the oldest retained item.
  node_ptr head() const { return head_.load(std::memory_order_acquire); }

  std::vector<T> values() const {
    std::vector<T> out;
    auto n = head()->next.load(std::memory_order_acquire);
    while (n) {
      out.push_back(*n->value);
      n = n->next.load(std::memory_order_acquire);
    }
    return out;
  }

  std::size_t size() const { return size_.load(std::memory_order_acquire); }
  std::size_t capacity() const noexcept { return capacity_; }

private:
  const std::size_t capacity_;
  std::mutex m_;
  std::atomic<node_ptr> head_;
  node_ptr tail_;
  std::atomic<std::size_t> size_{0};
  std::uint64_t count_{0};
};

} // namespace detail
} // namespace surge
