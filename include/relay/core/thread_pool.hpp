#pragma once
#include <relay/core/scheduler.hpp>
#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <thread>
#include <vector>
#include <mutex>
#include <functional>

namespace relay {

// Fixed set of workers. Jobs run by (priority desc, submission order asc).
class thread_pool final : public executor {
public:
  explicit thread_pool(std::size_t threads = std::thread::hardware_concurrency())
  : stop_(false) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this]{
        for (;;) {
          std::function<void()> task;
          {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait(lock, [&]{ return stop_ || !q_.empty(); });
            if (stop_ && q_.empty()) return;
            std::pop_heap(q_.begin(), q_.end(), later{});
            task = std::move(q_.back().fn);
            q_.pop_back();
          }
          task();
        }
      });
    }
  }

  // Drains the queue, then joins. Long-running jobs must be cancelled first.
  ~thread_pool() override {
    {
      std::lock_guard<std::mutex> lock(m_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
  }

  void post(std::function<void()> f) override { post(std::move(f), priority{}); }

  void post(std::function<void()> f, priority prio) override {
    {
      std::lock_guard<std::mutex> lock(m_);
      q_.push_back(job{prio.value, seq_++, std::move(f)});
      std::push_heap(q_.begin(), q_.end(), later{});
    }
    cv_.notify_one();
  }

  std::size_t size() const noexcept { return workers_.size(); }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;

private:
  struct job {
    int prio;
    std::uint64_t seq;
    std::function<void()> fn;
  };
  struct later {
    bool operator()(const job& a, const job& b) const noexcept {
      if (a.prio != b.prio) return a.prio < b.prio;
      return a.seq > b.seq;
    }
  };

  std::mutex m_;
  std::condition_variable cv_;
  std::vector<job> q_;  // heap ordered by later
  std::vector<std::thread> workers_;
  std::uint64_t seq_{0};
  bool stop_;
};

} // namespace relay
