#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

namespace {

// True when vs is strictly increasing by one.
bool contiguous(const std::vector<int>& vs) {
  for (std::size_t i = 1; i < vs.size(); ++i) {
    if (vs[i] != vs[i - 1] + 1) return false;
  }
  return true;
}

} // namespace

int main() {
  // 1) replay(unbounded): 1,2,3, subscribe, 4, complete
  {
    replay_subject<int> s;
    s.on_next(1);
    s.on_next(2);
    s.on_next(3);
    recorder<int> r;
    auto sub = s.subscribe(r.as_observer());
    s.on_next(4);
    s.on_completed();
    assert((r.values() == std::vector<int>{1, 2, 3, 4}));
    assert(r.completions() == 1 && r.terminals() == 1);
  }

  // 2) every variant ignores on_next after its terminal event
  {
    publish_subject<int> p;
    behavior_subject<int> b(0);
    replay_subject<int> rp;
    async_subject<int> a;
    recorder<int> rp_rec, b_rec, p_rec, a_rec;
    auto s1 = p.subscribe(p_rec.as_observer());
    auto s2 = b.subscribe(b_rec.as_observer());
    auto s3 = rp.subscribe(rp_rec.as_observer());
    auto s4 = a.subscribe(a_rec.as_observer());

    p.on_completed();
    b.on_completed();
    rp.on_completed();
    a.on_completed();
    for (int i = 1; i <= 100; ++i) {
      p.on_next(i);
      b.on_next(i);
      rp.on_next(i);
      a.on_next(i);
    }
    assert(p_rec.count() == 0);
    assert((b_rec.values() == std::vector<int>{0}));
    assert(rp_rec.count() == 0 && rp.size() == 0);
    assert(a_rec.count() == 0 && !a.has_value());
  }

  // 3) subscribers joining while a producer thread emits
  {
    publish_subject<int> s;
    constexpr int total = 20000;
    std::atomic<bool> go{false};
    std::thread producer([&] {
      while (!go.load()) std::this_thread::yield();
      for (int i = 0; i < total; ++i) s.on_next(i);
      s.on_completed();
    });

    std::vector<std::unique_ptr<recorder<int>>> recs;
    std::vector<subscription> subs;
    go = true;
    for (int i = 0; i < 50; ++i) {
      recs.push_back(std::make_unique<recorder<int>>());
      subs.push_back(s.subscribe(recs.back()->as_observer()));
    }
    producer.join();

    for (auto& r : recs) {
      assert(r->terminals() == 1);
      assert(contiguous(r->values()) && "a subscriber must see a gap-free suffix");
      if (r->count() > 0) assert(r->values().back() == total - 1);
    }
  }

  // 4) behavior: a subscriber joining under concurrent emission starts with
  //    some current value and then sees strictly newer values in order
  {
    behavior_subject<int> s(0);
    constexpr int total = 20000;
    std::atomic<bool> go{false};
    std::thread producer([&] {
      while (!go.load()) std::this_thread::yield();
      for (int i = 1; i <= total; ++i) s.on_next(i);
      s.on_completed();
    });

    std::vector<std::unique_ptr<recorder<int>>> recs;
    std::vector<subscription> subs;
    go = true;
    for (int i = 0; i < 50; ++i) {
      recs.push_back(std::make_unique<recorder<int>>());
      subs.push_back(s.subscribe(recs.back()->as_observer()));
    }
    producer.join();

    for (auto& r : recs) {
      auto vs = r->values();
      assert(!vs.empty() && "a behavior subject always has a first value");
      assert(contiguous(vs) && "no gaps or duplicates after the first value");
      assert(vs.back() == total);
      assert(r->completions() == 1);
    }
  }

  // 5) bounded replay: late subscribers under concurrent emission get the
  //    retained window followed by the live values, without gaps or duplicates
  {
    constexpr std::size_t k = 16;
    auto s = replay_subject<int>::with_size(k);
    for (int i = 0; i < 100; ++i) s.on_next(i);

    recorder<int> quiet;
    auto sq = s.subscribe(quiet.as_observer());
    auto first = quiet.values();
    assert(first.size() == k && first.front() == 100 - static_cast<int>(k));
    assert(contiguous(first));

    constexpr int total = 20000;
    std::atomic<bool> go{false};
    std::thread producer([&] {
      while (!go.load()) std::this_thread::yield();
      for (int i = 100; i < total; ++i) s.on_next(i);
      s.on_completed();
    });

    std::vector<std::unique_ptr<recorder<int>>> recs;
    std::vector<subscription> subs;
    go = true;
    for (int i = 0; i < 50; ++i) {
      recs.push_back(std::make_unique<recorder<int>>());
      subs.push_back(s.subscribe(recs.back()->as_observer()));
    }
    producer.join();

    for (auto& r : recs) {
      auto vs = r->values();
      assert(vs.size() >= k);
      assert(contiguous(vs));
      assert(vs.back() == total - 1);
      assert(r->completions() == 1);
    }
    assert(quiet.count() == static_cast<std::size_t>(total - 100 + static_cast<int>(k)));
  }

  // 6) concurrent producers racing to terminate: exactly one terminal
  {
    for (int round = 0; round < 200; ++round) {
      publish_subject<int> s;
      recorder<int> r;
      auto sub = s.subscribe(r.as_observer());
      std::thread t1([&] { s.on_completed(); });
      std::thread t2([&] { s.on_error(std::make_exception_ptr(std::runtime_error("race"))); });
      t1.join();
      t2.join();
      assert(r.terminals() == 1);
    }
  }

  std::cout << "[subject_concurrency_tests] OK\n";
  return 0;
}
