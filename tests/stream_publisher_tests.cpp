#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <latch>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <relay/relay.hpp>

using namespace relay;
using namespace std::chrono_literals;

struct Recorder {
  std::mutex m;
  std::vector<int> items;
  std::atomic<int> completions{0};
  std::atomic<int> errors{0};
  std::string error_what;
  std::latch terminated{1};

  observer<int> make(demand per_item = demand::none()) {
    observer<int> o;
    o.on_next = [this, per_item](const int& v) {
      std::lock_guard<std::mutex> lock(m);
      items.push_back(v);
      return per_item;
    };
    o.on_error = [this](std::exception_ptr e) {
      try { std::rethrow_exception(e); }
      catch (const std::exception& ex) { std::lock_guard<std::mutex> lock(m); error_what = ex.what(); }
      ++errors;
      terminated.count_down();
    };
    o.on_completed = [this] {
      ++completions;
      terminated.count_down();
    };
    return o;
  }

  std::vector<int> snapshot() {
    std::lock_guard<std::mutex> lock(m);
    return items;
  }
};

int main() {
  thread_pool pool{2};

  // --- items in order, then exactly one completion ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    Recorder r;
    auto sub = from_stream(stream, pool).subscribe(r.make(), demand::unlimited());
    cont.yield(1);
    cont.yield(2);
    cont.yield(3);
    cont.finish();
    r.terminated.wait();
    std::this_thread::sleep_for(20ms);
    assert((r.snapshot() == std::vector<int>{1, 2, 3}));
    assert(r.completions.load() == 1 && r.errors.load() == 0);
  }

  // --- 1, 2, then failure E: item(1), item(2), failure(E), nothing after ---
  {
    auto [stream, cont] = async_throwing_stream<int>::make_stream();
    Recorder r;
    auto sub = from_stream(stream, pool).subscribe(r.make(), demand::unlimited());
    cont.yield(1);
    cont.yield(2);
    cont.fail(std::make_exception_ptr(std::runtime_error("E")));
    assert(!cont.yield(3));
    r.terminated.wait();
    std::this_thread::sleep_for(20ms);
    assert((r.snapshot() == std::vector<int>{1, 2}));
    assert(r.errors.load() == 1 && r.completions.load() == 0);
    assert(r.error_what == "E");
  }

  // --- demand 1 with 3 items: 2 stay buffered until demand arrives ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    Recorder r;
    auto sub = from_stream(stream, pool).subscribe(r.make(), demand::max(1));
    cont.yield(1);
    cont.yield(2);
    cont.yield(3);
    std::this_thread::sleep_for(50ms);
    assert((r.snapshot() == std::vector<int>{1}) && "undemanded items must wait in the buffer");

    sub.request(demand::max(2));
    assert((r.snapshot() == std::vector<int>{1, 2, 3}) && "request() drains the buffer");

    cont.yield(4);
    std::this_thread::sleep_for(30ms);
    assert(r.snapshot().size() == 3);
    sub.request(demand::max(1));
    assert((r.snapshot() == std::vector<int>{1, 2, 3, 4}));
    cont.finish();
    r.terminated.wait();
    assert(r.completions.load() == 1);
  }

  // --- observer asks for more from inside on_next ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    std::mutex m;
    std::vector<int> got;
    std::latch done{1};
    auto holder = std::make_shared<subscription>();

    observer<int> o;
    o.on_next = [&, holder](const int& v) {
      {
        std::lock_guard<std::mutex> lock(m);
        got.push_back(v);
      }
      holder->request(demand::max(1));  // re-entrant: must neither deadlock nor reorder
      return demand::none();
    };
    o.on_completed = [&] { done.count_down(); };

    *holder = from_stream(stream, pool).subscribe(std::move(o), demand::max(1));
    for (int i = 0; i < 50; ++i) cont.yield(i);
    cont.finish();
    done.wait();

    std::vector<int> expected;
    for (int i = 0; i < 50; ++i) expected.push_back(i);
    std::lock_guard<std::mutex> lock(m);
    assert(got == expected);
    holder->release();
  }

  // --- terminal event with undelivered items: the rest is dropped, completion is last ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    Recorder r;
    auto sub = from_stream(stream, pool).subscribe(r.make(), demand::max(1));
    cont.yield(1);
    cont.yield(2);
    cont.yield(3);
    cont.finish();
    r.terminated.wait();
    assert((r.snapshot() == std::vector<int>{1}));
    sub.request(demand::max(5));
    assert((r.snapshot() == std::vector<int>{1}) && "nothing after the terminal event");
    assert(r.completions.load() == 1);
  }

  // --- cancel: the list stops growing, no terminal event, driving loop released ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    Recorder r;
    auto sub = from_stream(stream, pool).subscribe(r.make(), demand::unlimited());
    cont.yield(1);
    cont.yield(2);
    std::this_thread::sleep_for(30ms);
    sub.reset();
    cont.yield(3);
    cont.finish();
    std::this_thread::sleep_for(30ms);
    assert((r.snapshot() == std::vector<int>{1, 2}));
    assert(r.completions.load() == 0 && r.errors.load() == 0);
  }

  // --- observer throws from on_next: its exception is the one terminal event, nothing after ---
  {
    auto [stream, cont] = async_stream<int>::make_stream();
    std::atomic<int> nexts{0}, errors{0}, completions{0};
    std::string what;
    std::latch terminated{1};

    observer<int> o;
    o.on_next = [&](const int&) -> demand {
      ++nexts;
      throw std::runtime_error("consumer broke");
    };
    o.on_error = [&](std::exception_ptr e) {
      try { std::rethrow_exception(e); } catch (const std::exception& ex) { what = ex.what(); }
      ++errors;
      terminated.count_down();
    };
    o.on_completed = [&] { ++completions; };

    auto sub = from_stream(stream, pool).subscribe(std::move(o), demand::unlimited());
    cont.yield(1);
    terminated.wait();
    cont.yield(2);
    cont.finish();
    sub.request(demand::max(10));
    std::this_thread::sleep_for(30ms);
    assert(nexts.load() == 1 && "no delivery after the observer failed");
    assert(errors.load() == 1 && completions.load() == 0);
    assert(what == "consumer broke");
  }

  // --- infallible stream: sink-style subscribe without an error channel ---
  {
    async_stream<int> stream{[](async_stream<int>::continuation c) {
      c.yield(5);
      c.yield(6);
      c.finish();
    }};
    std::latch done{1};
    std::vector<int> got;
    auto sub = from_stream(stream, pool).subscribe([&](int v) { got.push_back(v); },
                                                   [&] { done.count_down(); });
    done.wait();
    assert((got == std::vector<int>{5, 6}));
  }

  std::cout << "[stream_publisher_tests] OK\n";
  return 0;
}
