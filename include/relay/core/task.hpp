#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>

#include <relay/core/errors.hpp>
#include <relay/core/future.hpp>
#include <relay/core/scheduler.hpp>

namespace relay {

namespace detail {

template <class F>
struct task_result {
  using type = std::invoke_result_t<F&>;
};

template <class F>
  requires std::is_invocable_v<F&, std::stop_token>
struct task_result<F> {
  using type = std::invoke_result_t<F&, std::stop_token>;
};

template <class F>
using task_result_t = std::decay_t<typename task_result<std::decay_t<F>>::type>;

} // namespace detail

// Handle of a computation posted to an executor: one result or one failure.
// Copies share the same computation.
template <class T>
class task {
public:
  using value_type = T;

  task() = default;

  // Used by spawn(); st and stop are shared by every copy of the handle.
  task(std::shared_ptr<detail::shared_state<T>> st, std::shared_ptr<std::stop_source> stop)
    : st_(std::move(st)), stop_(std::move(stop)) {}

  bool valid() const noexcept { return static_cast<bool>(st_); }

  // Cooperative: a body that has not started yet never runs and resolves with
  // cancelled_error; a running body sees it through its stop_token.
  void cancel() const { if (stop_) stop_->request_stop(); }
  std::stop_token stop_token() const { return stop_ ? stop_->get_token() : std::stop_token{}; }

  bool is_ready() const { return st_ && st_->is_ready(); }
  void wait() const { st_->wait(); }

  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const { return st_->wait_for(d); }

  // Blocks. Returns a copy of the result or rethrows the failure.
  T get() const {
    st_->wait();
    if (auto e = st_->error()) std::rethrow_exception(e);
    return *st_->value();
  }

  // Runs fn once the result (value or failure) is available.
  void on_ready(std::function<void()> fn) const { st_->on_ready(std::move(fn)); }

  std::exception_ptr error() const { return st_->error(); }
  std::optional<T> value() const { return st_->value(); }

private:
  std::shared_ptr<detail::shared_state<T>> st_;
  std::shared_ptr<std::stop_source> stop_;
};

// Posts body to ex at the given priority hint.
// body is called as body(std::stop_token) when it accepts one, body() otherwise.
// IMPORTANT: ex must outlive the task!
template <class F>
auto spawn(executor& ex, priority prio, F&& body) -> task<detail::task_result_t<F>> {
  using T = detail::task_result_t<F>;
  static_assert(!std::is_void_v<T>, "relay::spawn: body must return a value");

  auto st = std::make_shared<detail::shared_state<T>>();
  auto stop = std::make_shared<std::stop_source>();

  ex.post([st, stop, fn = std::decay_t<F>(std::forward<F>(body))]() mutable {
    auto token = stop->get_token();
    if (token.stop_requested()) {
      st->set_exception(std::make_exception_ptr(cancelled_error("task cancelled before start")));
      return;
    }
    try {
      if constexpr (std::is_invocable_v<decltype(fn)&, std::stop_token>) {
        st->set_value(fn(token));
      } else {
        st->set_value(fn());
      }
    } catch (...) {
      st->set_exception(std::current_exception());
    }
  }, prio);

  return task<T>(std::move(st), std::move(stop));
}

template <class F>
auto spawn(executor& ex, F&& body) {
  return spawn(ex, priority{}, std::forward<F>(body));
}

} // namespace relay
