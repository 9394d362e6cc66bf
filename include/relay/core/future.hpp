#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay {

template <class T> class promise;
template <class T> class future;

namespace detail {

// Single-assignment slot shared by one promise and one future.
// The first set_* wins; later ones report false and change nothing.
template <class T>
class shared_state {
public:
  bool set_value(T v) {
    return complete([&] { value_.emplace(std::move(v)); });
  }

  bool set_exception(std::exception_ptr e) {
    return complete([&] { error_ = std::move(e); });
  }

  bool is_ready() const {
    std::lock_guard<std::mutex> lock(m_);
    return ready_;
  }

  void wait() const {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait(lock, [&] { return ready_; });
  }

  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(m_);
    return cv_.wait_for(lock, d, [&] { return ready_; });
  }

  // Rethrows the stored failure; the value is moved out.
  T take() {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait(lock, [&] { return ready_; });
    if (error_) std::rethrow_exception(error_);
    if (!value_) throw std::logic_error("relay::future: value already retrieved");
    T out = std::move(*value_);
    value_.reset();
    return out;
  }

  // Runs fn once the state is ready: right away when it already is,
  // otherwise on the completing thread.
  void on_ready(std::function<void()> fn) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!ready_) {
        callbacks_.push_back(std::move(fn));
        return;
      }
    }
    fn();
  }

  // Copies of the outcome for observers that must not consume it.
  std::exception_ptr error() const {
    std::lock_guard<std::mutex> lock(m_);
    return error_;
  }

  std::optional<T> value() const {
    std::lock_guard<std::mutex> lock(m_);
    return value_;
  }

private:
  template <class Store>
  bool complete(Store store) {
    std::vector<std::function<void()>> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (ready_) return false;
      store();
      ready_ = true;
      local.swap(callbacks_);
    }
    cv_.notify_all();
    for (auto& fn : local) fn();
    return true;
  }

  mutable std::mutex m_;
  mutable std::condition_variable cv_;
  std::optional<T> value_;
  std::exception_ptr error_;
  std::vector<std::function<void()>> callbacks_;
  bool ready_{false};
};

} // namespace detail

// Write side of a one-shot result.
template <class T>
class promise {
  static_assert(!std::is_void_v<T>, "relay::promise<void> is not supported");
public:
  promise() : st_(std::make_shared<detail::shared_state<T>>()) {}

  future<T> get_future() const { return future<T>(st_); }

  // true when this call completed the result
  bool set_value(T v) const { return st_->set_value(std::move(v)); }
  bool set_exception(std::exception_ptr e) const { return st_->set_exception(std::move(e)); }

private:
  std::shared_ptr<detail::shared_state<T>> st_;
};

// Read side of a one-shot result. Move-only, get() consumes the value.
template <class T>
class future {
public:
  future() = default;

  future(const future&) = delete;
  future& operator=(const future&) = delete;
  future(future&&) noexcept = default;
  future& operator=(future&&) noexcept = default;

  bool valid() const noexcept { return static_cast<bool>(st_); }
  bool is_ready() const { return st_ && st_->is_ready(); }

  void wait() const { require().wait(); }

  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const { return require().wait_for(d); }

  // Blocks until ready. Returns the value or rethrows the failure.
  T get() {
    auto st = std::move(st_);
    if (!st) throw std::logic_error("relay::future: no state");
    return st->take();
  }

  void on_ready(std::function<void()> fn) const { require().on_ready(std::move(fn)); }

private:
  template <class U> friend class promise;

  explicit future(std::shared_ptr<detail::shared_state<T>> st) : st_(std::move(st)) {}

  detail::shared_state<T>& require() const {
    if (!st_) throw std::logic_error("relay::future: no state");
    return *st_;
  }

  std::shared_ptr<detail::shared_state<T>> st_;
};

} // namespace relay
