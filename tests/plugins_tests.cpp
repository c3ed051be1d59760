#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <surge/surge.hpp>
#include "test_support.hpp"

using namespace surge;
using namespace surge_test;

int main() {
  // 1) without a handler the error is only logged; nothing throws
  {
    plugins::reset();
    plugins::on_error(std::make_exception_ptr(std::runtime_error("logged only")));
    plugins::on_error(nullptr);
  }

  // 2) the installed handler receives the error as is
  {
    captured_errors hook;
    plugins::on_error(std::make_exception_ptr(std::out_of_range("lost")));
    assert(hook.size() == 1);
    assert(holds<std::out_of_range>(hook.at(0)));
  }
  assert(!plugins::get_error_handler() && "captured_errors must restore the default");

  // 3) a throwing handler is contained
  {
    plugins::set_error_handler([](std::exception_ptr) { throw std::runtime_error("handler broke"); });
    plugins::on_error(std::make_exception_ptr(std::runtime_error("x")));
    plugins::reset();
  }

  // 4) describe() renders std exceptions, foreign payloads and null
  {
    assert(describe(std::make_exception_ptr(std::runtime_error("boom"))) == "boom");
    assert(describe(std::make_exception_ptr(42)) == "unknown exception");
    assert(describe(nullptr) == "null exception");
  }

  // 5) an error arriving after the subscriber cancelled has nowhere to go
  {
    captured_errors hook;
    observer<int> held;
    auto src = observable<int>::make([&held](observer<int> o) {
      o.subscribe(empty_disposable());
      held = o;
    });
    recorder<int> r;
    auto sub = src.subscribe(r.as_observer());
    sub.reset();
    held.error(std::make_exception_ptr(std::runtime_error("after cancel")));
    assert(r.terminals() == 0);
    assert(hook.size() == 1 && holds<std::runtime_error>(hook.at(0)));
  }

  // 6) protocol_violation and missing_backpressure are distinct families
  {
    auto pv = std::make_exception_ptr(protocol_violation("p"));
    auto mb = std::make_exception_ptr(missing_backpressure("m"));
    assert(holds<std::logic_error>(pv) && !holds<std::runtime_error>(pv));
    assert(holds<std::runtime_error>(mb) && !holds<std::logic_error>(mb));
  }

  // 7) version macros agree with each other
  {
    static_assert(SURGE_VERSION_AT_LEAST(0, 1, 0));
    static_assert(!SURGE_VERSION_AT_LEAST(SURGE_VERSION_MAJOR + 1, 0, 0));
    static_assert(version::code == SURGE_VERSION_CODE);
    assert(std::string(version::string) == "0.1.0");
  }

  std::cout << "[plugins_tests] OK\n";
  return 0;
}
