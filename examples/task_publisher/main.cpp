#include <relay/relay.hpp>
#include <chrono>
#include <iostream>
#include <latch>
#include <string>
#include <thread>

using namespace relay;

int main() {
  std::cout << "relay " << version::string << "\n";

  thread_pool workers{2};
  inline_executor ui;

  // Background computation, published as a one-shot observable
  auto report = from_async(workers, priority{5}, []{
    std::this_thread::sleep_for(std::chrono::milliseconds(50)); // heavy work simulation
    return std::string("report ready");
  });

  std::latch done{2};

  // Two subscribers, one computation: the result is shared
  auto a = report.subscribe(
    [](const std::string& s){ std::cout << "[A] " << s << "\n"; },
    {},
    [&]{ done.count_down(); });

  auto b = report
    | for_each_async<std::string>(ui, priority{},
        [](std::string s){ std::cout << "[B] " << s << "\n"; },
        [&](completion c){
          std::cout << "[B] " << (c.finished() ? "finished" : "failed") << "\n";
          done.count_down();
        });

  done.wait();
  return 0;
}
