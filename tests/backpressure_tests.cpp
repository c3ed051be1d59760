#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

// Producer that pushes 0 .. k-1 and optionally completes, all during subscribe.
static flowable<int> burst(int k, backpressure_strategy strategy, std::size_t capacity = default_buffer_size,
                           bool complete = true) {
  return flowable<int>::create([k, complete](flowable_emitter<int> em) {
    for (int i = 0; i < k; ++i) em.on_next(i);
    if (complete) em.on_completed();
  }, strategy, capacity);
}

static std::vector<int> range_of(int from, int to) {
  std::vector<int> out;
  for (int i = from; i < to; ++i) out.push_back(i);
  return out;
}

int main() {
  // --- buffer: K items at zero demand, then request(K): all K, in order ---
  {
    recorder<int> r;
    burst(50, backpressure_strategy::buffer).subscribe(r.as_subscriber(0));
    assert(r.count() == 0 && r.terminals() == 0 && "nothing without demand, the completion waits too");

    r.request(20);
    assert((r.values() == range_of(0, 20)));
    assert(r.completions() == 0);

    r.request(30);
    assert((r.values() == range_of(0, 50)) && "buffer must not lose anything");
    assert(r.completions() == 1);
  }

  // --- drop: with outstanding demand D < K exactly D items arrive, no error ---
  {
    recorder<int> r;
    burst(10, backpressure_strategy::drop, default_buffer_size, false).subscribe(r.as_subscriber(4));
    assert((r.values() == range_of(0, 4)));
    assert(r.error_count() == 0);

    // items emitted without demand are gone for good
    r.request(10);
    assert(r.count() == 4);
  }

  // --- drop: an item emitted from inside on_next sees the demand it just used up ---
  {
    publish_subject<int> subj;
    recorder<int> r;
    auto s = r.as_subscriber(1);
    auto record = s.on_next;
    s.on_next = [&subj, record](const int& v) {
      record(v);
      if (v == 0) subj.on_next(100);
    };
    (subj.as_observable() | to_flowable(backpressure_strategy::drop)).subscribe(s);

    subj.on_next(0);
    subj.on_next(1);
    assert((r.values() == std::vector<int>{0}) && "100 and 1 arrived without demand");

    r.request(1);
    assert((r.values() == std::vector<int>{0}) && "nothing was kept back");
    subj.on_next(2);
    assert((r.values() == std::vector<int>{0, 2}));
  }

  // --- drop_latest: a full queue discards the arriving item ---
  {
    recorder<int> r;
    burst(10, backpressure_strategy::drop_latest, 3, false).subscribe(r.as_subscriber(0));
    r.request(100);
    assert((r.values() == std::vector<int>{0, 1, 2}));
  }

  // --- drop_oldest: a full queue evicts its oldest item ---
  {
    recorder<int> r;
    burst(10, backpressure_strategy::drop_oldest, 3).subscribe(r.as_subscriber(0));
    r.request(100);
    assert((r.values() == std::vector<int>{7, 8, 9}));
    assert(r.completions() == 1);
  }

  // --- error: overflow fails with missing_backpressure, queued items are dropped ---
  {
    recorder<int> r;
    burst(10, backpressure_strategy::error, 3).subscribe(r.as_subscriber(0));
    assert(r.count() == 0);
    assert(r.terminals() == 1 && holds<missing_backpressure>(r.error()));
  }

  // --- error: within capacity everything arrives ---
  {
    recorder<int> r;
    burst(3, backpressure_strategy::error, 3).subscribe(r.as_subscriber(0));
    r.request(3);
    assert((r.values() == range_of(0, 3)) && r.completions() == 1);
  }

  // --- buffer: a pending error goes out after the queued items ---
  {
    recorder<int> r;
    flowable<int>::create([](flowable_emitter<int> em) {
      em.on_next(1);
      em.on_next(2);
      em.on_error(std::make_exception_ptr(std::runtime_error("late")));
    }, backpressure_strategy::buffer).subscribe(r.as_subscriber(0));
    assert(r.terminals() == 0);
    r.request(1);
    assert(r.terminals() == 0);
    r.request(1);
    assert((r.values() == std::vector<int>{1, 2}));
    assert(holds<std::runtime_error>(r.error()));
  }

  // --- cancel releases the producer's resource and stops delivery ---
  {
    int released = 0;
    std::optional<flowable_emitter<int>> held;
    recorder<int> r;
    flowable<int>::create([&](flowable_emitter<int> em) {
      em.set_cancellable([&] { ++released; });
      held.emplace(em);
    }, backpressure_strategy::buffer).subscribe(r.as_subscriber(5));

    held->on_next(1);
    r.cancel();
    assert(held->is_cancelled());
    held->on_next(2);
    held->on_completed();
    assert((r.values() == std::vector<int>{1}));
    assert(r.terminals() == 0);
    assert(released == 1);
  }

  // --- requested() reports the outstanding demand to the producer ---
  {
    std::optional<flowable_emitter<int>> held;
    recorder<int> r;
    flowable<int>::create([&](flowable_emitter<int> em) { held.emplace(em); },
                          backpressure_strategy::buffer).subscribe(r.as_subscriber(3));
    assert(held->requested() == 3);
    held->on_next(1);
    assert(held->requested() == 2);
    r.request(unbounded);
    assert(held->requested() == unbounded);
  }

  // --- to_flowable: a push source behind the demand protocol ---
  {
    manual_source<int> src;
    recorder<int> r;
    (src.obs() | to_flowable(backpressure_strategy::drop_oldest, 2)).subscribe(r.as_subscriber(1));
    for (int i = 0; i < 6; ++i) src.next(i);
    r.request(10);
    assert((r.values() == std::vector<int>{0, 4, 5}));

    r.cancel();
    assert(src.unsubs->load() == 1 && "cancel must reach the observable");
  }

  // --- to_observable: demand is dropped, everything flows ---
  {
    recorder<int> r;
    auto sub = burst(5, backpressure_strategy::buffer).to_observable().subscribe(r.as_observer());
    assert((r.values() == range_of(0, 5)) && r.completions() == 1);
  }

  // --- a producer that throws fails the subscriber ---
  {
    recorder<int> r;
    flowable<int>::create([](flowable_emitter<int> em) {
      em.on_next(1);
      throw std::logic_error("producer bug");
    }, backpressure_strategy::buffer).subscribe(r.as_subscriber(10));
    assert((r.values() == std::vector<int>{1}));
    assert(holds<std::logic_error>(r.error()));
  }

  std::cout << "[backpressure_tests] OK\n";
  return 0;
}
