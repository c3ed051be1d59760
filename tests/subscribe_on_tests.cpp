#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

// A synchronous observable that, when subscribed:
//    - emits the current thread_id,
//    - completes
static observable<std::thread::id> emit_current_thread_then_done() {
  return observable<std::thread::id>::create(
    [](auto on_next, auto, auto on_done){
      if (on_next) on_next(std::this_thread::get_id());
      if (on_done) on_done();
      return subscription{};
    }
  );
}

int main() {
  // 1) The subscription is actually executed in the scheduler thread
  {
    single_thread_scheduler sch;
    recorder<std::thread::id> r;

    auto sub = (emit_current_thread_then_done()
      | subscribe_on(sch)
    ).subscribe(r.as_observer());

    assert(r.wait_until([&]{ return r.terminals() == 1; }));
    assert(r.values().size() == 1);
    assert(r.values().front() == sch.worker_id() && "subscribe_on: emissions during subscribe must run on scheduler thread");
    assert(r.completions() == 1 && "on_completed must be called");
  }

  // 2) Unsubscribe before actually subscribing - nothing should fly in / fall out
  {
    single_thread_scheduler sch;
    std::atomic<bool> got{false};
    std::atomic<int> subscribed{0};

    // keep the worker busy until the subscription has been dropped
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    sch.execute([opened]{ opened.wait(); });

    auto src = observable<int>::create([&](auto on_next, auto, auto){
      ++subscribed;
      if (on_next) on_next(42);
      return subscription{};
    });

    subscription sub = (src | subscribe_on(sch)).subscribe([&](int){ got = true; });
    sub.reset();
    gate.set_value();

    // a marker task queued behind the subscribe task
    std::promise<void> flushed;
    sch.execute([&flushed]{ flushed.set_value(); });
    flushed.get_future().wait();

    assert(subscribed.load() == 0 && "the source must not be subscribed at all");
    assert(!got && "no emissions expected after early unsubscribe");
  }

  // 3) Errors from the scheduler's subscribe context
  {
    single_thread_scheduler sch;
    recorder<int> r;

    auto src = observable<int>::create([](auto on_next, auto on_err, auto){
      if (on_next) on_next(1);
      if (on_err) on_err(std::make_exception_ptr(std::runtime_error("boom")));
      return subscription{};
    });

    auto sub = (src | subscribe_on(sch)).subscribe(r.as_observer());
    assert(r.wait_until([&]{ return r.terminals() == 1; }));
    assert(r.count() == 1 && holds<std::runtime_error>(r.error()));
  }

  // 4) manual scheduler: the source runs when the queue is drained
  {
    manual_scheduler sch;
    recorder<int> r;
    auto sub = (from_values<int>({1, 2}) | subscribe_on(sch)).subscribe(r.as_observer());
    assert(r.count() == 0 && r.subscribes() == 1);
    sch.drain();
    assert((r.values() == std::vector<int>{1, 2}) && r.completions() == 1);
  }

  // 5) inline scheduler: everything happens on the calling thread
  {
    inline_scheduler sch;
    recorder<std::thread::id> r;
    auto sub = (emit_current_thread_then_done() | subscribe_on(sch) | observe_on(sch)).subscribe(r.as_observer());
    assert(r.values().size() == 1 && r.values().front() == std::this_thread::get_id());
    assert(r.completions() == 1);

    bool ran = false;
    auto token = sch.schedule([&]{ ran = true; }, std::chrono::milliseconds(1));
    assert(ran && token->is_disposed());
  }

  std::cout << "[subscribe_on_tests] OK\n";
  return 0;
}
