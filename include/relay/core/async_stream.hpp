#pragma once
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace relay {

// Push-based producer: an unbounded channel fed through a continuation at the
// producer's own pace and read by one consumer with next().
// Copies of a stream share the same channel.
template <class T, bool Throwing>
class basic_async_stream {
  struct state {
    std::mutex m;
    std::condition_variable_any cv;
    std::deque<T> q;
    std::exception_ptr error;
    bool finished{false};
  };

public:
  using value_type = T;
  static constexpr bool throwing = Throwing;

  // Producer side. yield() after finish()/fail() is dropped and returns false.
  class continuation {
  public:
    bool yield(T v) const {
      {
        std::lock_guard<std::mutex> lock(st_->m);
        if (st_->finished) return false;
        st_->q.push_back(std::move(v));
      }
      st_->cv.notify_all();
      return true;
    }

    void finish() const { terminate(nullptr); }

    void fail(std::exception_ptr e) const requires Throwing { terminate(std::move(e)); }

  private:
    friend class basic_async_stream;
    explicit continuation(std::shared_ptr<state> st) : st_(std::move(st)) {}

    void terminate(std::exception_ptr e) const {
      {
        std::lock_guard<std::mutex> lock(st_->m);
        if (st_->finished) return;
        st_->finished = true;
        st_->error = std::move(e);
      }
      st_->cv.notify_all();
    }

    std::shared_ptr<state> st_;
  };

  // The builder receives the continuation; it may keep a copy to feed later.
  explicit basic_async_stream(const std::function<void(continuation)>& build)
    : st_(std::make_shared<state>()) {
    build(continuation(st_));
  }

  static std::pair<basic_async_stream, continuation> make_stream() {
    basic_async_stream s{std::make_shared<state>()};
    continuation c{s.st_};
    return {std::move(s), std::move(c)};
  }

  // Blocks until the next item. Empty when the stream ended or stop was requested.
  // A failure is rethrown once every item queued before it has been read.
  std::optional<T> next(std::stop_token token = {}) {
    std::unique_lock<std::mutex> lock(st_->m);
    st_->cv.wait(lock, token, [&] { return !st_->q.empty() || st_->finished; });
    if (!st_->q.empty()) {
      std::optional<T> v{std::move(st_->q.front())};
      st_->q.pop_front();
      return v;
    }
    if (st_->finished && st_->error) {
      if constexpr (Throwing) std::rethrow_exception(st_->error);
    }
    return std::nullopt;
  }

private:
  explicit basic_async_stream(std::shared_ptr<state> st) : st_(std::move(st)) {}

  std::shared_ptr<state> st_;
};

template <class T> using async_stream = basic_async_stream<T, false>;
template <class T> using async_throwing_stream = basic_async_stream<T, true>;

} // namespace relay
