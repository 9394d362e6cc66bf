#pragma once
#include <functional>
#include <queue>
#include <mutex>

namespace relay {

// Priority hint: the higher the value, the earlier the job
struct priority {
  int value{0};
};

// Basic executor interface
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
  // Executors without a notion of priority ignore the hint
  virtual void post(std::function<void()> f, priority) { post(std::move(f)); }
};

// Synchronous: executes immediately (good for tests)
struct inline_executor final : executor {
  using executor::post;
  void post(std::function<void()> f) override { f(); }
};

// Sequential queue (no separate thread, executed by drain())
class strand final : public executor {
public:
  using executor::post;
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }
  // Explicit task drainage (call from the required thread)
  void drain() {
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front()); q_.pop();
      }
      f();
    }
  }
private:
  std::mutex m_;
  std::queue<std::function<void()>> q_;
};

} // namespace relay
