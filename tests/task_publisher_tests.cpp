#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <relay/relay.hpp>

using namespace relay;
using namespace std::chrono_literals;

struct Events {
  std::mutex m;
  std::vector<std::string> log;
  std::latch terminated{1};

  observer<int> make() {
    observer<int> o;
    o.on_next = [this](const int& v) { push("next:" + std::to_string(v)); return demand::none(); };
    o.on_error = [this](std::exception_ptr) { push("error"); terminated.count_down(); };
    o.on_completed = [this] { push("done"); terminated.count_down(); };
    return o;
  }
  void push(std::string s) {
    std::lock_guard<std::mutex> lock(m);
    log.push_back(std::move(s));
  }
  std::vector<std::string> snapshot() {
    std::lock_guard<std::mutex> lock(m);
    return log;
  }
};

int main() {
  thread_pool pool{2};

  // --- value: one item then completion ---
  {
    Events e;
    auto obs = from_async(pool, priority{2}, [] {
      std::this_thread::sleep_for(10ms);
      return 5;
    });
    auto sub = obs.subscribe(e.make(), demand::unlimited());
    e.terminated.wait();
    assert((e.snapshot() == std::vector<std::string>{"next:5", "done"}));
  }

  // --- failure: exactly one failure, no item ---
  {
    Events e;
    auto obs = from_async(pool, []() -> int { throw std::runtime_error("compute failed"); });
    auto sub = obs.subscribe(e.make(), demand::unlimited());
    e.terminated.wait();
    assert((e.snapshot() == std::vector<std::string>{"error"}));
  }

  // --- launched on construction, replayed to a late subscriber ---
  {
    std::atomic<int> runs{0};
    auto t = spawn(pool, [&] { ++runs; return 9; });
    auto obs = from_task(t);
    t.wait();
    std::this_thread::sleep_for(5ms);

    Events first, second;
    auto s1 = obs.subscribe(first.make(), demand::unlimited());
    auto s2 = obs.subscribe(second.make(), demand::unlimited());
    first.terminated.wait();
    second.terminated.wait();
    assert((first.snapshot() == std::vector<std::string>{"next:9", "done"}));
    assert((second.snapshot() == std::vector<std::string>{"next:9", "done"}));
    assert(runs.load() == 1 && "the computation runs once, whatever the subscriber count");
  }

  // --- no demand: the value waits for request(), a failure would not ---
  {
    Events e;
    auto obs = from_async(pool, [] { return 3; });
    auto sub = obs.subscribe(e.make(), demand::none());
    std::this_thread::sleep_for(30ms);
    assert(e.snapshot().empty());
    sub.request(demand::max(1));
    e.terminated.wait();
    assert((e.snapshot() == std::vector<std::string>{"next:3", "done"}));
  }

  // --- cancelled subscription gets nothing ---
  {
    std::latch gate{1};
    Events e;
    auto obs = from_async(pool, [&] { gate.wait(); return 1; });
    auto sub = obs.subscribe(e.make(), demand::unlimited());
    sub.reset();
    gate.count_down();
    std::this_thread::sleep_for(30ms);
    assert(e.snapshot().empty());
  }

  // --- awaiting the observable again gives the task result ---
  {
    auto obs = from_async(pool, [] { return std::string("round trip"); });
    assert(last_value(obs).get() == "round trip");
  }

  // --- temporary observable: the subscription keeps the pending result alive ---
  {
    auto f = last_value(from_async(pool, [] {
      std::this_thread::sleep_for(20ms);
      return 5;
    }));
    assert(f.wait_for(1s) && "awaiting a temporary must still resolve");
    assert(f.get() == 5);

    Events e;
    auto sub = from_async(pool, [] {
      std::this_thread::sleep_for(20ms);
      return 6;
    }).subscribe(e.make(), demand::unlimited());
    e.terminated.wait();
    assert((e.snapshot() == std::vector<std::string>{"next:6", "done"}));
  }

  // --- observer throws from on_next: it gets its own exception, no completion ---
  {
    Events e;
    auto obs = from_async(pool, [] { return 1; });
    observer<int> o = e.make();
    o.on_next = [&e](const int& v) -> demand {
      e.push("next:" + std::to_string(v));
      throw std::runtime_error("consumer broke");
    };
    auto sub = obs.subscribe(std::move(o), demand::unlimited());
    e.terminated.wait();
    assert((e.snapshot() == std::vector<std::string>{"next:1", "error"}));
  }

  std::cout << "[task_publisher_tests] OK\n";
  return 0;
}
