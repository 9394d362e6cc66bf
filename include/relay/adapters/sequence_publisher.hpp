#pragma once
#include <relay/core/demand.hpp>
#include <relay/core/log.hpp>
#include <relay/core/observable.hpp>
#include <relay/core/scheduler.hpp>
#include <relay/core/sequence.hpp>
#include <relay/core/subscription.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace relay {

// Waiting policy of the pull bridge while the consumer has no demand.
// Delays double from min_delay, each wait capped at max_delay.
struct backoff_policy {
  std::chrono::milliseconds min_delay{1};
  std::chrono::milliseconds max_delay{50};
  std::size_t max_retries{10};
};

struct sequence_options {
  backoff_policy backoff{};
};

namespace detail {

// One subscription to a pull sequence.
// The driving loop pulls, then delivers only against demand: nothing is
// buffered. Without demand it backs off; if demand never shows up the pulled
// item is dropped and the loop stops (no terminal event).
template <pull_sequence S>
class sequence_subscription
  : public std::enable_shared_from_this<sequence_subscription<S>> {
public:
  using T = typename S::value_type;

  sequence_subscription(S seq, observer<T> obs, demand initial, sequence_options opts)
    : demand_(initial)
    , obs_(std::make_shared<const observer<T>>(std::move(obs)))
    , seq_(std::move(seq))
    , opts_(opts) {}

  // IMPORTANT: ex must outlive the subscription!
  void start(executor& ex) {
    ex.post([self = this->shared_from_this()] { self->run(); });
  }

  void request(demand d) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!obs_) return;
      demand_.increment(d);
    }
    cv_.notify_all();
  }

  void cancel() {
    stop_.request_stop();
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!obs_) return;
      obs_.reset();
    }
    cv_.notify_all();
    log::logger()->debug("sequence subscription cancelled");
  }

private:
  void run() {
    auto token = stop_.get_token();
    for (;;) {
      std::optional<T> item;
      try {
        item = pull_next(seq_, token);
      } catch (...) {
        finish(std::current_exception());
        return;
      }
      // cancellation is silent: no terminal event
      if (token.stop_requested()) return;
      if (!item) {
        finish(nullptr);
        return;
      }
      if (!deliver(std::move(*item))) return;
    }
  }

  // false: stop pulling
  bool deliver(T item) {
    std::unique_lock<std::mutex> lock(m_);
    if (!obs_) return false;
    if (!demand_.has_demand() && !wait_for_demand(lock)) return false;

    demand_.try_consume_one();
    auto obs = obs_;
    lock.unlock();

    demand more;
    try {
      more = obs->on_next ? obs->on_next(item) : demand::none();
    } catch (...) {
      // the observer's own exception ends the subscription, the producer is not pulled again
      log::logger()->warn("sequence subscription: observer threw from on_next, cancelling");
      stop_.request_stop();
      finish(std::current_exception());
      return false;
    }

    lock.lock();
    if (obs_) demand_.increment(more);
    return true;
  }

  // Called with the lock held. true once demand is available.
  bool wait_for_demand(std::unique_lock<std::mutex>& lock) {
    auto token = stop_.get_token();
    const auto& bp = opts_.backoff;
    auto delay = std::min(bp.min_delay, bp.max_delay);

    for (std::size_t retry = 0; retry < bp.max_retries; ++retry) {
      // request() and cancel() notify, so the wait ends early on either
      cv_.wait_for(lock, token, delay, [&] { return demand_.has_demand() || !obs_; });
      if (token.stop_requested() || !obs_) return false;
      if (demand_.has_demand()) return true;
      delay = std::min(delay * 2, bp.max_delay);
    }
    if (demand_.has_demand()) return true;

    log::logger()->warn("sequence subscription: no demand after {} retries, "
                        "dropping the pending item and stopping", bp.max_retries);
    obs_.reset();
    return false;
  }

  // One-shot: only the first terminal event finds the observer.
  void finish(std::exception_ptr e) {
    std::shared_ptr<const observer<T>> obs;
    {
      std::lock_guard<std::mutex> lock(m_);
      obs.swap(obs_);
    }
    if (!obs) return;
    if (e) {
      log::logger()->debug("sequence subscription failed");
      if (obs->on_error) obs->on_error(e);
    } else {
      log::logger()->debug("sequence subscription completed");
      if (obs->on_completed) obs->on_completed();
    }
  }

  std::mutex m_;
  std::condition_variable_any cv_;
  demand_tracker demand_;
  std::shared_ptr<const observer<T>> obs_;
  std::stop_source stop_;
  S seq_;
  sequence_options opts_;
};

} // namespace detail

// Cold observable over a pull sequence: every subscription pulls its own copy
// of seq on ex.
// IMPORTANT: ex must outlive every subscription!
template <pull_sequence S>
observable<typename S::value_type> from_sequence(S seq, executor& ex,
                                                 sequence_options opts = {}) {
  using T = typename S::value_type;
  return observable<T>::create([seq = std::move(seq), ex = &ex, opts](observer<T> obs, demand initial) {
    auto st = std::make_shared<detail::sequence_subscription<S>>(seq, std::move(obs), initial, opts);
    st->start(*ex);
    return subscription([st] { st->cancel(); }, [st](demand d) { st->request(d); });
  });
}

} // namespace relay
