#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

int main() {
  // 1) subscribers only see what was emitted after they joined
  {
    publish_subject<int> s;
    recorder<int> a, b;

    s.on_next(0);
    auto sa = s.subscribe(a.as_observer());
    s.on_next(1);
    auto sb = s.subscribe(b.as_observer());
    s.on_next(2);
    s.on_completed();

    assert((a.values() == std::vector<int>{1, 2}));
    assert((b.values() == std::vector<int>{2}));
    assert(a.completions() == 1 && b.completions() == 1);
    assert(s.has_complete() && s.has_terminated() && !s.has_error());
  }

  // 2) nothing after the terminal event; a late subscriber gets only the terminal
  {
    auto s = publish_subject<std::string>::create();
    recorder<std::string> early;
    auto se = s.subscribe(early.as_observer());

    s.on_error(std::make_exception_ptr(std::runtime_error("broken")));
    s.on_next("ignored");
    s.on_completed();
    s.on_error(std::make_exception_ptr(std::logic_error("ignored too")));

    assert(early.count() == 0);
    assert(early.terminals() == 1 && holds<std::runtime_error>(early.error()));
    assert(holds<std::runtime_error>(s.error()));

    recorder<std::string> late;
    auto sl = s.subscribe(late.as_observer());
    assert(late.subscribes() == 1 && late.count() == 0);
    assert(late.terminals() == 1 && holds<std::runtime_error>(late.error()));
  }

  // 3) disposing one subscriber leaves the others alone
  {
    publish_subject<int> s;
    recorder<int> a, b;
    auto sa = s.subscribe(a.as_observer());
    auto sb = s.subscribe(b.as_observer());
    assert(s.observer_count() == 2);

    s.on_next(1);
    sa.reset();
    assert(s.observer_count() == 1);
    s.on_next(2);

    assert((a.values() == std::vector<int>{1}));
    assert((b.values() == std::vector<int>{1, 2}));
  }

  // 4) cancelling from inside on_subscribe never registers the subscriber
  {
    publish_subject<int> s;
    int seen = 0;
    observer<int> o;
    o.on_subscribe = [](const disposable_ptr& d) { d->dispose(); };
    o.on_next = [&](const int&) { ++seen; };
    auto sub = s.subscribe(o);
    s.on_next(1);
    assert(seen == 0);
    assert(!s.has_observers());
  }

  // 5) a subscriber may unsubscribe itself from on_next
  {
    publish_subject<int> s;
    std::vector<int> got;
    auto handle = std::make_shared<disposable_ptr>();
    observer<int> o;
    o.on_subscribe = [handle](const disposable_ptr& d) { *handle = d; };
    o.on_next = [&, handle](const int& v) {
      got.push_back(v);
      if (v == 2) (*handle)->dispose();
    };
    auto sub = s.subscribe(o);
    for (int i = 1; i <= 4; ++i) s.on_next(i);
    assert((got == std::vector<int>{1, 2}));
  }

  // 6) a null value terminates the subject with protocol_violation
  {
    publish_subject<std::shared_ptr<int>> s;
    recorder<std::shared_ptr<int>> r;
    auto sub = s.subscribe(r.as_observer());
    s.on_next(std::make_shared<int>(1));
    s.on_next(nullptr);
    s.on_next(std::make_shared<int>(3));
    assert(r.count() == 1);
    assert(s.has_error() && holds<protocol_violation>(r.error()));
  }

  // 7) the subject as an observer of another source; a later upstream is
  //    disposed once the subject terminated
  {
    publish_subject<int> s;
    recorder<int> r;
    auto sub = s.subscribe(r.as_observer());
    auto up = from_values<int>({1, 2, 3}).subscribe(s.as_observer());
    assert((r.values() == std::vector<int>{1, 2, 3}));
    assert(r.completions() == 1);

    auto late = empty_disposable();
    s.on_subscribe(late);
    assert(late->is_disposed());
  }

  // 8) copies share the subject
  {
    publish_subject<int> s;
    auto copy = s;
    recorder<int> r;
    auto sub = copy.as_observable().subscribe(r.as_observer());
    s.on_next(5);
    assert((r.values() == std::vector<int>{5}));
  }

  std::cout << "[publish_subject_tests] OK\n";
  return 0;
}
