#pragma once
#include <relay/core/demand.hpp>
#include <relay/core/errors.hpp>
#include <relay/core/future.hpp>
#include <relay/core/log.hpp>
#include <relay/core/observable.hpp>
#include <relay/core/subscription.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace relay {

namespace detail {

// State of one outstanding await: the latest item, a one-shot resume guard and
// the upstream subscription (cancelled as soon as the await resumes).
template <class T, class R>
struct pending_await {
  std::mutex m;
  std::optional<T> last;
  bool resumed{false};
  subscription upstream;
  promise<R> result;

  struct on_stop {
    std::weak_ptr<pending_await> self;
    void operator()() const {
      if (auto s = self.lock()) s->cancelled();
    }
  };
  std::optional<std::stop_callback<on_stop>> stop_cb;

  // Called on cancellation; decides what the await resumes with.
  std::function<void()> cancelled;

  // Holds the subscription unless the await already resumed meanwhile.
  void attach(subscription s) {
    {
      std::lock_guard<std::mutex> lock(m);
      if (!resumed) {
        upstream = std::move(s);
        return;
      }
    }
    s.reset();
  }

  // One-shot: false when someone else already resumed.
  template <class Complete>
  bool resume(Complete complete) {
    subscription up;
    {
      std::lock_guard<std::mutex> lock(m);
      if (resumed) return false;
      resumed = true;
      up = std::move(upstream);
    }
    up.reset();
    complete(result);
    return true;
  }

  std::optional<T> latest() {
    std::lock_guard<std::mutex> lock(m);
    return last;
  }
};

template <class T, class R, class OnNext, class OnError, class OnCompleted, class OnCancel>
future<R> await_observable(const observable<T>& src, std::stop_token token,
                           OnNext on_next, OnError on_error, OnCompleted on_completed,
                           OnCancel on_cancel) {
  auto st = std::make_shared<pending_await<T, R>>();
  auto fut = st->result.get_future();

  // checked right away: a stopped token never subscribes
  if (token.stop_requested()) {
    on_cancel(*st);
    return fut;
  }

  observer<T> obs;
  obs.on_next = [st, on_next](const T& v) {
    on_next(*st, v);
    return demand::none();
  };
  obs.on_error = [st, on_error](std::exception_ptr e) { on_error(*st, e); };
  obs.on_completed = [st, on_completed] { on_completed(*st); };

  st->cancelled = [w = std::weak_ptr<pending_await<T, R>>(st), on_cancel] {
    if (auto s = w.lock()) on_cancel(*s);
  };

  st->attach(src.subscribe(std::move(obs), demand::unlimited()));

  // registered after subscribing: a stop requested in between runs the callback inline
  st->stop_cb.emplace(token, typename pending_await<T, R>::on_stop{st});
  return fut;
}

} // namespace detail

// Waits for the observable to terminate and yields the LAST item it emitted.
// - completion after items   -> that last item
// - completion without items -> no_output_error
// - failure                  -> the failure, whatever was seen before
// - stop requested           -> cancelled_error, upstream cancelled
template <class T>
future<T> last_value(const observable<T>& src, std::stop_token token = {}) {
  using state = detail::pending_await<T, T>;
  return detail::await_observable<T, T>(
    src, std::move(token),
    [](state& s, const T& v) {
      std::lock_guard<std::mutex> lock(s.m);
      s.last = v;
    },
    [](state& s, std::exception_ptr e) {
      s.resume([&](promise<T>& p) { p.set_exception(e); });
    },
    [](state& s) {
      auto v = s.latest();
      s.resume([&](promise<T>& p) {
        if (v) p.set_value(std::move(*v));
        else p.set_exception(std::make_exception_ptr(no_output_error{}));
      });
    },
    [](state& s) {
      s.resume([](promise<T>& p) {
        p.set_exception(std::make_exception_ptr(cancelled_error("await cancelled")));
      });
    });
}

// Infallible flavour: nothing to report failures through, so
// "no output" and cancellation both yield whatever was seen (maybe nothing).
template <class T>
future<std::optional<T>> last_value(const infallible_observable<T>& src, std::stop_token token = {}) {
  using state = detail::pending_await<T, std::optional<T>>;
  auto finish = [](state& s) {
    auto v = s.latest();
    s.resume([&](promise<std::optional<T>>& p) { p.set_value(std::move(v)); });
  };
  return detail::await_observable<T, std::optional<T>>(
    src.as_observable(), std::move(token),
    [](state& s, const T& v) {
      std::lock_guard<std::mutex> lock(s.m);
      s.last = v;
    },
    [finish](state& s, std::exception_ptr) {
      log::logger()->error("last_value: an infallible observable reported a failure");
      finish(s);
    },
    finish,
    finish);
}

// obs | last_value(token)
struct op_last_value {
  std::stop_token token;

  template <class T>
  auto operator()(const observable<T>& src) const { return relay::last_value(src, token); }

  template <class T>
  auto operator()(const infallible_observable<T>& src) const { return relay::last_value(src, token); }
};

inline auto last_value(std::stop_token token = {}) { return op_last_value{ std::move(token) }; }

} // namespace relay
