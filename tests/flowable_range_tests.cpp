#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

static std::vector<int> range_of(int from, int to) {
  std::vector<int> out;
  for (int i = from; i < to; ++i) out.push_back(i);
  return out;
}

int main() {
  // 1) range(1, 100): request(5), then request(1000)
  {
    recorder<int> r;
    flowable<int>::range(1, 100).subscribe(r.as_subscriber(0));
    assert(r.count() == 0);

    r.request(5);
    assert((r.values() == range_of(1, 6)));
    assert(r.completions() == 0);

    r.request(1000);
    assert((r.values() == range_of(1, 101)) && "the rest exactly once");
    assert(r.completions() == 1 && r.terminals() == 1);

    r.request(5);
    assert(r.count() == 100 && r.completions() == 1);
  }

  // 2) never more items than requested at the time of delivery
  {
    std::int64_t outstanding = 0;
    bool overrun = false;
    std::vector<int> got;
    flow_subscription_ptr upstream;

    auto s = make_subscriber<int>(
      [&](const flow_subscription_ptr& fs) { upstream = fs; },
      [&](const int& v) {
        if (outstanding == 0) overrun = true;
        --outstanding;
        got.push_back(v);
      });
    flowable<int>::range(0, 50).subscribe(s);

    for (int step = 1; got.size() < 50; step = step % 7 + 1) {
      outstanding += step;
      upstream->request(step);
    }
    assert(!overrun);
    assert((got == range_of(0, 50)));
  }

  // 3) re-entrant request from on_next does not recurse or reorder
  {
    std::vector<int> got;
    flow_subscription_ptr upstream;
    subscriber<int> s;
    s.on_subscribe = [&](const flow_subscription_ptr& fs) {
      upstream = fs;
      fs->request(1);
    };
    s.on_next = [&](const int& v) {
      got.push_back(v);
      upstream->request(1);
    };
    bool done = false;
    s.on_completed = [&] { done = true; };
    flowable<int>::range(0, 10000).subscribe(s);
    assert(got.size() == 10000 && got.front() == 0 && got.back() == 9999);
    assert(done);
  }

  // 4) request(0) or a negative request is a protocol violation
  {
    recorder<int> r;
    flowable<int>::range(1, 10).subscribe(r.as_subscriber(0));
    r.request(0);
    assert(r.terminals() == 1 && holds<protocol_violation>(r.error()));
    r.request(5);
    assert(r.count() == 0 && "the violation also cancelled the source");

    recorder<int> n;
    flowable<int>::range(1, 10).subscribe(n.as_subscriber(2));
    n.request(-3);
    assert(n.count() == 2 && holds<protocol_violation>(n.error()));
  }

  // 5) cancel in the middle stops the emission
  {
    std::vector<int> got;
    flow_subscription_ptr upstream;
    subscriber<int> s;
    s.on_subscribe = [&](const flow_subscription_ptr& fs) {
      upstream = fs;
      fs->request(unbounded);
    };
    s.on_next = [&](const int& v) {
      got.push_back(v);
      if (v == 3) upstream->cancel();
    };
    bool done = false;
    s.on_completed = [&] { done = true; };
    flowable<int>::range(0, 100).subscribe(s);
    assert((got == range_of(0, 4)));
    assert(!done);
  }

  // 6) empty range and from/just
  {
    recorder<int> e;
    flowable<int>::range(5, 0).subscribe(e.as_subscriber(0));
    assert(e.completions() == 1 && "an empty range completes without demand");

    recorder<int> j;
    flowable<int>::just(4, 5, 6).subscribe(j.as_subscriber(2));
    assert((j.values() == std::vector<int>{4, 5}));
    j.request(1);
    assert((j.values() == std::vector<int>{4, 5, 6}) && j.completions() == 1);
  }

  // 7) a throwing on_next cancels the source and becomes on_error
  {
    recorder<int> r;
    int calls = 0;
    subscriber<int> s = r.as_subscriber(unbounded);
    auto record = s.on_next;
    s.on_next = [&, record](const int& v) {
      ++calls;
      if (v == 2) throw std::runtime_error("consumer failed");
      record(v);
    };
    flowable<int>::range(0, 10).subscribe(s);
    assert(calls == 3);
    assert((r.values() == std::vector<int>{0, 1}));
    assert(holds<std::runtime_error>(r.error()));
  }

  // 8) callback form requests everything; the subscription cancels
  {
    std::vector<int> got;
    bool done = false;
    auto sub = flowable<int>::range(0, 5).subscribe([&](int v) { got.push_back(v); }, nullptr,
                                                   [&] { done = true; });
    assert((got == range_of(0, 5)) && done);
  }

  // 9) a null element fails the subscriber
  {
    recorder<std::shared_ptr<int>> r;
    flowable<std::shared_ptr<int>>::from({std::make_shared<int>(1), nullptr, std::make_shared<int>(3)})
        .subscribe(r.as_subscriber(unbounded));
    assert(r.count() == 1 && holds<protocol_violation>(r.error()));
  }

  std::cout << "[flowable_range_tests] OK\n";
  return 0;
}
