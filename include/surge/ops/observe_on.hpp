#pragma once
#include <atomic>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <surge/core/disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/scheduler.hpp>

namespace surge {

namespace detail {

// Queue in front of the scheduler. Only one delivery task is in flight at a
// time (wip_), so the downstream sees events one after the other and in
// arrival order, whatever threads the scheduler uses.
template <class T>
class observe_on_state : public std::enable_shared_from_this<observe_on_state<T>> {
public:
  observe_on_state(observer<T> down, scheduler* sch) : down_(std::move(down)), sch_(sch) {}

  const std::shared_ptr<serial_disposable>& upstream() const noexcept { return up_; }

  void on_next(const T& v) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      q_.push_back(v);
    }
    schedule();
  }

  void on_error(std::exception_ptr e) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      done_ = true;
      error_ = std::move(e);
    }
    schedule();
  }

  void on_completed() {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      done_ = true;
    }
    schedule();
  }

private:
  void schedule() {
    if (wip_.fetch_add(1, std::memory_order_acq_rel) != 0) return;
    auto self = this->shared_from_this();
    sch_->execute([self] { self->run(); });
  }

  void run() {
    int missed = 1;
    for (;;) {
      for (;;) {
        if (up_->is_disposed()) {
          clear();
          return;
        }
        std::optional<T> item;
        bool done = false;
        std::exception_ptr err;
        {
          std::lock_guard<std::mutex> lock(m_);
          if (!q_.empty()) {
            item.emplace(std::move(q_.front()));
            q_.pop_front();
          } else {
            done = done_;
            err = error_;
          }
        }
        if (item) {
          down_.next(*item);
          continue;
        }
        if (done) {
          up_->dispose();
          if (err) down_.error(err);
          else down_.completed();
          return;
        }
        break;
      }
      missed = wip_.fetch_sub(missed, std::memory_order_acq_rel) - missed;
      if (missed == 0) return;
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(m_);
    q_.clear();
  }

  observer<T> down_;
  scheduler* sch_;
  std::shared_ptr<serial_disposable> up_ = std::make_shared<serial_disposable>();
  std::mutex m_;
  std::deque<T> q_;
  bool done_{false};
  std::exception_ptr error_;
  std::atomic<int> wip_{0};
};

} // namespace detail

// ----------------------------
// observe_on(scheduler&)
// IMPORTANT: the scheduler must outlive the subscription!
// ----------------------------
struct op_observe_on {
  scheduler* sch;

  template <class T>
  observable<T> operator()(const observable<T>& src) const {
    return observable<T>::make([src, sch = sch](observer<T> o) {
      auto st = std::make_shared<detail::observe_on_state<T>>(o, sch);
      o.subscribe(st->upstream());

      observer<T> up;
      up.on_subscribe = [st](const disposable_ptr& d) { st->upstream()->replace(d); };
      up.on_next      = [st](const T& v) { st->on_next(v); };
      up.on_error     = [st](std::exception_ptr e) { st->on_error(std::move(e)); };
      up.on_completed = [st] { st->on_completed(); };
      src.subscribe(std::move(up)).release();
    });
  }
};

inline auto observe_on(scheduler& sch) { return op_observe_on{ &sch }; }

} // namespace surge
