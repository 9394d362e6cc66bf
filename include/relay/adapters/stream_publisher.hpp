#pragma once
#include <relay/core/async_stream.hpp>
#include <relay/core/demand.hpp>
#include <relay/core/log.hpp>
#include <relay/core/observable.hpp>
#include <relay/core/scheduler.hpp>
#include <relay/core/subscription.hpp>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>
#include <variant>

namespace relay {

struct stream_end {};
struct stream_failure {
  std::exception_ptr error;
};

// Outcome of one step of the driving loop
template <class T>
using stream_result = std::variant<T, stream_failure, stream_end>;

namespace detail {

// One subscription to a push stream.
// Items the consumer has no demand for are buffered WITHOUT bound: a fast
// producer facing a stalled consumer grows memory, items are never dropped.
template <class T, bool Throwing>
class stream_subscription
  : public std::enable_shared_from_this<stream_subscription<T, Throwing>> {
public:
  using stream_type = basic_async_stream<T, Throwing>;

  stream_subscription(stream_type stream, observer<T> obs, demand initial)
    : demand_(initial)
    , obs_(std::make_shared<const observer<T>>(std::move(obs)))
    , stream_(std::move(stream)) {}

  // IMPORTANT: ex must outlive the subscription!
  void start(executor& ex) {
    ex.post([self = this->shared_from_this()] { self->run(); });
  }

  void request(demand d) {
    std::unique_lock<std::mutex> lock(m_);
    if (!obs_) return;
    demand_.increment(d);
    drain(lock);
  }

  void cancel() {
    stop_.request_stop();
    std::lock_guard<std::mutex> lock(m_);
    if (!obs_ && !terminal_) return;
    obs_.reset();
    terminal_.reset();
    buffer_.clear();
    log::logger()->debug("stream subscription cancelled");
  }

private:
  void run() {
    auto token = stop_.get_token();
    for (;;) {
      std::optional<T> item;
      // only the producer's own failures become stream_failure
      try {
        item = stream_.next(token);
      } catch (...) {
        if (token.stop_requested()) return;
        handle(stream_result<T>{std::in_place_index<1>, stream_failure{std::current_exception()}});
        return;
      }
      if (token.stop_requested()) return;
      if (!item) {
        handle(stream_result<T>{std::in_place_index<2>});
        return;
      }
      handle(stream_result<T>{std::in_place_index<0>, std::move(*item)});
    }
  }

  // Every outcome of the driving loop goes through here, under one lock.
  void handle(stream_result<T> r) {
    std::unique_lock<std::mutex> lock(m_);
    if (!obs_) return;
    if (auto* item = std::get_if<0>(&r)) {
      buffer_.push_back(std::move(*item));
      drain(lock);
      return;
    }

    // terminal: park it; the drainer hands out what demand still allows,
    // drops the rest and emits it last
    terminal_ = std::move(r);
    drain(lock);
  }

  // Called with the lock held; may release it for good once the terminal event
  // is out. Only one thread drains at a time, the others leave their items and
  // demand to it. Observer calls happen unlocked.
  void drain(std::unique_lock<std::mutex>& lock) {
    if (draining_) return;
    draining_ = true;
    while (obs_ && !buffer_.empty() && demand_.try_consume_one()) {
      T v = std::move(buffer_.front());
      buffer_.pop_front();
      auto obs = obs_;
      lock.unlock();
      demand more;
      try {
        more = obs->on_next ? obs->on_next(v) : demand::none();
      } catch (...) {
        lock.lock();
        draining_ = false;
        observer_failed(lock, std::current_exception());
        return;
      }
      lock.lock();
      demand_.increment(more);
    }
    draining_ = false;
    if (terminal_) emit_terminal(lock);
  }

  // on_next threw: the producer is stopped, pending items are dropped and the
  // observer gets its own exception as the terminal failure.
  // Called with the lock held, releases it.
  void observer_failed(std::unique_lock<std::mutex>& lock, std::exception_ptr e) {
    stop_.request_stop();
    log::logger()->warn("stream subscription: observer threw from on_next, cancelling");
    terminal_.emplace(std::in_place_index<1>, stream_failure{std::move(e)});
    emit_terminal(lock);
  }

  // Called with the lock held, releases it.
  void emit_terminal(std::unique_lock<std::mutex>& lock) {
    auto obs = std::move(obs_);
    obs_.reset();
    auto r = std::move(terminal_);
    terminal_.reset();
    buffer_.clear();
    lock.unlock();

    if (!obs || !r) return;
    if (auto* f = std::get_if<1>(&*r)) {
      log::logger()->debug("stream subscription failed");
      if (obs->on_error) obs->on_error(f->error);
    } else {
      log::logger()->debug("stream subscription completed");
      if (obs->on_completed) obs->on_completed();
    }
  }

  std::mutex m_;
  demand_tracker demand_;
  std::deque<T> buffer_;
  std::shared_ptr<const observer<T>> obs_;
  std::optional<stream_result<T>> terminal_;
  bool draining_{false};
  std::stop_source stop_;
  stream_type stream_;
};

template <class T, bool Throwing>
observable<T> stream_observable(basic_async_stream<T, Throwing> stream, executor& ex) {
  return observable<T>::create([stream = std::move(stream), ex = &ex](observer<T> obs, demand initial) {
    auto st = std::make_shared<stream_subscription<T, Throwing>>(stream, std::move(obs), initial);
    st->start(*ex);
    return subscription([st] { st->cancel(); }, [st](demand d) { st->request(d); });
  });
}

} // namespace detail

// A stream that cannot fail gives an observable that cannot fail.
// IMPORTANT: ex must outlive every subscription!
template <class T>
infallible_observable<T> from_stream(async_stream<T> stream, executor& ex) {
  return infallible_observable<T>(detail::stream_observable(std::move(stream), ex));
}

template <class T>
observable<T> from_stream(async_throwing_stream<T> stream, executor& ex) {
  return detail::stream_observable(std::move(stream), ex);
}

} // namespace relay
