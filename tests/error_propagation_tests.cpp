#include <cassert>
#include <iostream>
#include <relay/relay.hpp>
#include <stdexcept>
#include <string>

using namespace relay;

int main() {
  // A source that emits 1 and then fails
  auto src = observable<int>::create([](observer<int> o, demand) {
    if (o.on_next) o.on_next(1);
    if (o.on_error) o.on_error(std::make_exception_ptr(std::runtime_error("boom")));
    return subscription{};
  });

  int sum = 0;
  std::string what;
  auto sub = src.subscribe([&](int v) { sum += v; },
                           [&](std::exception_ptr e) {
                             try { std::rethrow_exception(e); }
                             catch (const std::runtime_error& ex) { what = ex.what(); }
                           });

  sub.reset();
  assert(sum == 1 && "Only the first on_next should pass");
  assert(what == "boom" && "on_error must carry the original exception");

  // A cancel hook that throws is reported, reset() itself does not throw
  bool called = false;
  {
    subscription s([&] { called = true; throw std::runtime_error("cancel failed"); });
    s.reset();
    assert(!s && "after reset the subscription is empty");
  }
  assert(called);

  // request() after reset is a no-op
  int requested = 0;
  subscription r([] {}, [&](demand) { ++requested; });
  r.request(demand::max(1));
  r.reset();
  r.request(demand::max(1));
  assert(requested == 1);

  std::cout << "[error_propagation_tests] OK\n";
  return 0;
}
