#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <surge/core/composite_disposable.hpp>
#include <surge/core/disposable.hpp>
#include <surge/core/observable.hpp>
#include <surge/core/scheduler.hpp>
#include <surge/core/subscription.hpp>
#include <surge/subjects/publish_subject.hpp>
#include <surge/subjects/replay_subject.hpp>

namespace surge {

// ── Connectable Observable ────────────────────────────────────────────────────
// Subscribers attach to an internal subject; the source is subscribed only
// by connect(). Once the connection is gone (disposed, or for publish the
// source terminated) the next subscriber or connect() starts over with a
// fresh subject.
template <class T, class Subject = publish_subject<T>>
class connectable_observable {
public:
  using OnNext          = typename observable<T>::OnNext;
  using OnErr           = typename observable<T>::OnErr;
  using OnDone          = typename observable<T>::OnDone;
  using subject_factory = std::function<Subject()>;

  connectable_observable(observable<T> src, subject_factory factory, bool reset_on_terminal)
    : st_(std::make_shared<state>(std::move(src), std::move(factory), reset_on_terminal)) {}

  observable<T> as_observable() const {
    auto st = st_;
    return observable<T>::make([st](observer<T> o) {
      Subject s = st->current_subject();
      s.subscribe(std::move(o)).release();
    });
  }

  subscription subscribe(observer<T> o) const { return as_observable().subscribe(std::move(o)); }

  subscription subscribe(OnNext on_next, OnErr on_err = {}, OnDone on_done = {}) const {
    return as_observable().subscribe(std::move(on_next), std::move(on_err), std::move(on_done));
  }

  // Subscribes the subject to the source unless already connected.
  // While connected, every call returns the same handle.
  disposable_ptr connect() const { return st_->connect(); }

  bool is_connected() const {
    std::lock_guard<std::mutex> lock(st_->m);
    return st_->connected;
  }

private:
  class connection;

  struct state : std::enable_shared_from_this<state> {
    state(observable<T> s, subject_factory f, bool reset)
      : src(std::move(s)), factory(std::move(f)), reset_on_terminal(reset), subject(factory()) {}

    Subject current_subject() {
      std::lock_guard<std::mutex> lock(m);
      ensure_fresh();
      return subject;
    }

    disposable_ptr connect() {
      std::shared_ptr<connection> c;
      Subject s = [&] {
        std::lock_guard<std::mutex> lock(m);
        if (connected) return subject;
        ensure_fresh();
        connected = true;
        c = std::make_shared<connection>(this->weak_from_this());
        conn = c;
        return subject;
      }();
      if (!c) {
        std::lock_guard<std::mutex> lock(m);
        return conn ? disposable_ptr(conn) : empty_disposable();
      }

      observer<T> up = s.as_observer();
      up.on_subscribe = [c](const disposable_ptr& d) { c->attach(d); };
      if (reset_on_terminal) {
        std::weak_ptr<state> wst = this->weak_from_this();
        up.on_error = [s, wst, c](std::exception_ptr e) mutable {
          s.on_error(std::move(e));
          if (auto st = wst.lock()) st->disconnect(c.get());
        };
        up.on_completed = [s, wst, c]() mutable {
          s.on_completed();
          if (auto st = wst.lock()) st->disconnect(c.get());
        };
      }
      src.subscribe(std::move(up)).release();
      return c;
    }

    // Called with m held.
    void ensure_fresh() {
      if (connected) return;
      if (needs_reset || subject.has_terminated()) {
        subject = factory();
        needs_reset = false;
      }
    }

    void disconnect(const connection* c) {
      std::lock_guard<std::mutex> lock(m);
      if (conn.get() != c) return;
      conn.reset();
      connected = false;
      needs_reset = true;
    }

    std::mutex m;
    observable<T> src;
    subject_factory factory;
    const bool reset_on_terminal;
    Subject subject;
    bool connected{false};
    bool needs_reset{false};
    std::shared_ptr<connection> conn;
  };

  // Handle returned by connect(): disposing it cuts the source off and
  // marks the subject for replacement.
  class connection final : public disposable {
  public:
    explicit connection(std::weak_ptr<state> owner) : owner_(std::move(owner)) {}

    void attach(const disposable_ptr& d) { upstream_.replace(d); }

    void dispose() noexcept override {
      if (disposed_.exchange(true, std::memory_order_acq_rel)) return;
      if (auto st = owner_.lock()) st->disconnect(this);
      upstream_.dispose();
    }

    bool is_disposed() const noexcept override { return disposed_.load(std::memory_order_acquire); }

  private:
    std::weak_ptr<state> owner_;
    serial_disposable upstream_;
    std::atomic<bool> disposed_{false};
  };

  std::shared_ptr<state> st_;
};

// publish(): cold -> connectable, live values only
template <class T>
inline connectable_observable<T> publish(const observable<T>& src) {
  return connectable_observable<T>(src, [] { return publish_subject<T>(); }, true);
}

// replay(): cold -> connectable that replays everything to late subscribers
template <class T>
inline connectable_observable<T, replay_subject<T>> replay(const observable<T>& src) {
  return connectable_observable<T, replay_subject<T>>(src, [] { return replay_subject<T>(); }, false);
}

// replay(src, k): replays the last k values
template <class T>
inline connectable_observable<T, replay_subject<T>> replay(const observable<T>& src, std::size_t k) {
  return connectable_observable<T, replay_subject<T>>(
      src, [k] { return replay_subject<T>::with_size(k); }, false);
}

namespace detail {

struct ref_count_state {
  std::mutex m;
  std::size_t refs{0};
  disposable_ptr connection;
  disposable_ptr grace_timer;
  std::uint64_t epoch{0};   // bumped whenever refs leaves or reaches zero
  scheduler* sch{nullptr};
  std::chrono::milliseconds grace{0};
};

template <class T, class Subject>
observable<T> ref_count_impl(connectable_observable<T, Subject> conn, std::shared_ptr<ref_count_state> st) {
  return observable<T>::make([conn, st](observer<T> o) {
    std::uint64_t my_epoch = 0;
    bool connect_now = false;
    disposable_ptr timer;
    {
      std::lock_guard<std::mutex> lock(st->m);
      if (st->refs++ == 0) {
        ++st->epoch;
        timer = std::exchange(st->grace_timer, nullptr);
        // a connection kept alive by the grace period is reused
        connect_now = !(st->connection && conn.is_connected());
      }
      my_epoch = st->epoch;
    }
    if (timer) timer->dispose();

    auto leave = make_disposable([st] {
      disposable_ptr c;
      std::uint64_t epoch = 0;
      {
        std::lock_guard<std::mutex> lock(st->m);
        if (st->refs == 0 || --st->refs != 0) return;
        epoch = ++st->epoch;
        if (!st->sch) c = std::exchange(st->connection, nullptr);
      }
      if (c) {
        c->dispose();
        return;
      }
      if (!st->sch) return;
      auto t = st->sch->schedule([st, epoch] {
        disposable_ptr expired;
        {
          std::lock_guard<std::mutex> lock(st->m);
          if (st->refs != 0 || st->epoch != epoch) return;
          expired = std::exchange(st->connection, nullptr);
          st->grace_timer = nullptr;
        }
        if (expired) expired->dispose();
      }, st->grace);
      std::lock_guard<std::mutex> lock(st->m);
      if (st->epoch == epoch && st->refs == 0 && !t->is_disposed()) st->grace_timer = t;
    });

    // per-subscriber handle: the subject slot plus the ref release
    auto handle = std::make_shared<composite_disposable>();
    handle->add(leave);
    o.subscribe(handle);

    // the observer is attached to the (fresh) subject before connect() runs,
    // so a synchronous source cannot finish ahead of it
    observer<T> fwd;
    fwd.on_subscribe = [handle](const disposable_ptr& d) { handle->add(d); };
    fwd.on_next      = [o](const T& v) { o.next(v); };
    fwd.on_error     = [o, leave](std::exception_ptr e) { o.error(std::move(e)); leave->dispose(); };
    fwd.on_completed = [o, leave] { o.completed(); leave->dispose(); };
    conn.as_observable().subscribe(std::move(fwd)).release();

    if (!connect_now) return;
    auto c = conn.connect();
    bool stale = false;
    {
      std::lock_guard<std::mutex> lock(st->m);
      stale = st->refs == 0 || st->epoch != my_epoch;
      if (!stale) st->connection = c;
    }
    if (stale) c->dispose();
  });
}

} // namespace detail

// ref_count(): connects on the first subscriber, disconnects when the last one leaves
template <class T, class Subject>
inline observable<T> ref_count(connectable_observable<T, Subject> conn) {
  return detail::ref_count_impl(std::move(conn), std::make_shared<detail::ref_count_state>());
}

// ref_count(conn, grace, sch): the disconnect is delayed by grace; a subscriber
// arriving in the meantime keeps the running connection.
// IMPORTANT: the scheduler must outlive the returned observable!
template <class T, class Subject, class Rep, class Period>
inline observable<T> ref_count(connectable_observable<T, Subject> conn,
                               std::chrono::duration<Rep, Period> grace,
                               scheduler& sch) {
  auto st = std::make_shared<detail::ref_count_state>();
  st->sch = &sch;
  st->grace = std::chrono::duration_cast<std::chrono::milliseconds>(grace);
  return detail::ref_count_impl(std::move(conn), std::move(st));
}

// auto_connect(conn, n): connects once n subscribers have joined; never disconnects.
template <class T, class Subject>
inline observable<T> auto_connect(connectable_observable<T, Subject> conn,
                                  std::size_t n = 1,
                                  std::function<void(disposable_ptr)> on_connect = {}) {
  if (n == 0) throw std::invalid_argument("auto_connect: subscriber count must be > 0");
  auto count = std::make_shared<std::atomic<std::size_t>>(0);
  return observable<T>::make([conn, n, count, on_connect](observer<T> o) {
    conn.as_observable().subscribe(std::move(o)).release();
    if (count->fetch_add(1, std::memory_order_acq_rel) + 1 != n) return;
    auto c = conn.connect();
    if (on_connect) on_connect(c);
  });
}

} // namespace surge
