#include <relay/relay.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

using namespace relay;

int main() {
  thread_pool io{2};      // drives the pull loop

  // A "slow" paginated source: every page takes a while to fetch
  int page = 0;
  auto pages = generate<int>([page]() mutable -> std::optional<int> {
    if (page == 5) return std::nullopt;
    std::this_thread::sleep_for(std::chrono::milliseconds(20)); // I/O simulation
    return ++page;
  });

  auto obs = from_sequence(pages, io);

  // Print every page as it arrives...
  auto sub = obs.subscribe(
    [](int p){ std::cout << "[PAGE] " << p << "\n"; },
    [](std::exception_ptr){ std::cout << "[PAGE] failed\n"; },
    []{ std::cout << "[PAGE] done\n"; });

  // ...and, independently, wait for the last one (cold: it pulls its own copy)
  try {
    std::cout << "[LAST] " << last_value(obs).get() << "\n";
  } catch (const no_output_error& e) {
    std::cout << "[LAST] " << e.what() << "\n";
  }
  return 0;
}
