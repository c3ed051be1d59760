#pragma once
#include <atomic>

namespace surge {

// "First terminal wins" cell: ACTIVE -> TERMINATING -> TERMINATED.
// Exactly one caller of try_terminate() gets true; everybody else must drop
// their terminal signal.
class terminal_gate {
  enum class state : int { active, terminating, terminated };

public:
  bool is_active() const noexcept {
    return s_.load(std::memory_order_acquire) == state::active;
  }

  bool is_terminated() const noexcept {
    return s_.load(std::memory_order_acquire) != state::active;
  }

  bool try_terminate() noexcept {
    auto expected = state::active;
    return s_.compare_exchange_strong(expected, state::terminating,
                                      std::memory_order_acq_rel,
                                      std::memory_order_acquire);
  }

  // Called by the winner once the terminal signal has been delivered.
  void mark_terminated() noexcept { s_.store(state::terminated, std::memory_order_release); }

private:
  std::atomic<state> s_{state::active};
};

} // namespace surge
