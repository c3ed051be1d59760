#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <surge/core/disposable.hpp>

namespace surge {

// Scheduling abstraction consumed by the operators that move work in time or
// across threads. Implementations live outside the library, except the two
// below used for synchronous code and deterministic tests.
struct scheduler {
  virtual ~scheduler() = default;
  virtual void execute(std::function<void()> task) = 0;
  // Runs task after delay unless the returned handle is disposed first.
  virtual disposable_ptr schedule(std::function<void()> task, std::chrono::milliseconds delay) = 0;
};

// Synchronous: executes immediately (good for MVP/tests).
// A delayed task blocks the calling thread for the delay.
struct inline_scheduler final : scheduler {
  void execute(std::function<void()> f) override { f(); }

  disposable_ptr schedule(std::function<void()> f, std::chrono::milliseconds delay) override {
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    f();
    return disposed();
  }
};

// Queue without a thread: tasks run when drain() or advance_by() is called
// from the owning thread (for example, a test or a UI loop).
// Time is virtual and only moves through advance_by().
class manual_scheduler final : public scheduler {
public:
  using duration = std::chrono::milliseconds;

  void execute(std::function<void()> f) override {
    schedule(std::move(f), duration{0});
  }

  disposable_ptr schedule(std::function<void()> f, duration delay) override {
    auto token = std::make_shared<boolean_disposable>();
    std::lock_guard<std::mutex> lock(m_);
    auto due = now_ + (delay.count() > 0 ? delay : duration{0});
    q_.emplace(key{due, seq_++}, entry{std::move(f), token});
    return token;
  }

  // Runs every task that is due at the current virtual time, including tasks
  // scheduled by the tasks themselves. Returns how many ran.
  std::size_t drain() { return run_until(now()); }

  // Moves virtual time forward, running due tasks in time order.
  std::size_t advance_by(duration d) {
    duration target;
    {
      std::lock_guard<std::mutex> lock(m_);
      target = now_ + d;
    }
    auto n = run_until(target);
    std::lock_guard<std::mutex> lock(m_);
    if (now_ < target) now_ = target;
    return n;
  }

  duration now() const {
    std::lock_guard<std::mutex> lock(m_);
    return now_;
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.size();
  }

private:
  using key = std::pair<duration, std::uint64_t>;
  struct entry {
    std::function<void()> fn;
    std::shared_ptr<boolean_disposable> token;
  };

  std::size_t run_until(duration target) {
    std::size_t ran = 0;
    for (;;) {
      entry e;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty() || q_.begin()->first.first > target) break;
        auto it = q_.begin();
        if (now_ < it->first.first) now_ = it->first.first;
        e = std::move(it->second);
        q_.erase(it);
      }
      if (e.token->is_disposed()) continue;
      e.token->dispose();
      e.fn();
      ++ran;
    }
    return ran;
  }

  mutable std::mutex m_;
  std::map<key, entry> q_;
  duration now_{0};
  std::uint64_t seq_{0};
};

} // namespace surge
