#include <relay/relay.hpp>
#include <chrono>
#include <iostream>
#include <latch>
#include <memory>
#include <thread>

using namespace relay;

int main() {
  relay::log::set_level(spdlog::level::debug);
  thread_pool pool{2};

  // Producer pushes 10 ticks at its own pace; nobody waits for the consumer
  async_throwing_stream<int> ticks([](auto cont){
    std::thread([cont]{
      for (int i = 1; i <= 10; ++i) cont.yield(i);
      cont.finish();
    }).detach();
  });

  std::latch done{1};
  auto holder = std::make_shared<subscription>();

  // Consumer takes 2 at a time: everything else waits in the buffer
  observer<int> obs;
  obs.on_next = [](const int& v){
    std::cout << "[TICK] " << v << "\n";
    return demand::none();
  };
  obs.on_error = [&](std::exception_ptr){ std::cout << "[TICK] failed\n"; done.count_down(); };
  obs.on_completed = [&]{ std::cout << "[TICK] done\n"; done.count_down(); };

  *holder = from_stream(ticks, pool).subscribe(std::move(obs), demand::max(2));

  for (int batch = 0; batch < 5; ++batch) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::cout << "[CONSUMER] ready for 2 more\n";
    holder->request(demand::max(2));
  }

  done.wait();
  return 0;
}
