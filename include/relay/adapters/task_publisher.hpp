#pragma once
#include <relay/core/demand.hpp>
#include <relay/core/log.hpp>
#include <relay/core/observable.hpp>
#include <relay/core/scheduler.hpp>
#include <relay/core/subscription.hpp>
#include <relay/core/task.hpp>
#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace relay {

namespace detail {

// Outcome of one task, replayed to every subscriber:
// value + completion (once the subscriber has demand) or failure (right away).
template <class T>
class task_publisher_state
  : public std::enable_shared_from_this<task_publisher_state<T>> {
public:
  explicit task_publisher_state(task<T> t) : task_(std::move(t)) {}

  void start() {
    task_.on_ready([w = this->weak_from_this()] {
      if (auto s = w.lock()) s->complete();
    });
  }

  subscription subscribe(observer<T> obs, demand initial) {
    auto sp = std::make_shared<const observer<T>>(std::move(obs));
    std::uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!(done_ && (error_ || !initial.is_none()))) {
        id = next_id_++;
        slots_.push_back(slot{id, sp, demand_tracker{initial}});
      }
    }
    if (id == 0) {
      deliver(*sp);
      return subscription{};
    }

    // the subscription owns the state: a temporary observable must not take
    // the pending result down with it
    auto self = this->shared_from_this();
    return subscription(
      [self, id] { self->cancel(id); },
      [self, id](demand d) { self->request(id, d); });
  }

private:
  struct slot {
    std::uint64_t id;
    std::shared_ptr<const observer<T>> obs;
    demand_tracker pending;
  };

  void request(std::uint64_t id, demand d) {
    std::shared_ptr<const observer<T>> ready;
    {
      std::lock_guard<std::mutex> lock(m_);
      auto it = find(id);
      if (it == slots_.end()) return;
      it->pending.increment(d);
      if (!done_ || !it->pending.has_demand()) return;
      ready = std::move(it->obs);
      slots_.erase(it);
    }
    deliver(*ready);
  }

  void cancel(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(m_);
    auto it = find(id);
    if (it != slots_.end()) slots_.erase(it);
  }

  void complete() {
    std::vector<std::shared_ptr<const observer<T>>> ready;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (done_) return;
      done_ = true;
      error_ = task_.error();
      if (!error_) value_ = task_.value();
      for (auto it = slots_.begin(); it != slots_.end();) {
        if (error_ || it->pending.has_demand()) {
          ready.push_back(std::move(it->obs));
          it = slots_.erase(it);
        } else {
          ++it;
        }
      }
    }
    log::logger()->debug("task publisher resolved ({}), {} subscriber(s) ready",
                         error_ ? "failure" : "value", ready.size());
    for (auto& obs : ready) deliver(*obs);
  }

  // Outside the lock. value_/error_ are immutable once done_ is set.
  // An observer that throws from on_next gets its own exception as the failure.
  void deliver(const observer<T>& obs) {
    if (error_) {
      if (obs.on_error) obs.on_error(error_);
      return;
    }
    try {
      if (obs.on_next) obs.on_next(*value_);
    } catch (...) {
      log::logger()->warn("task publisher: observer threw from on_next");
      if (obs.on_error) obs.on_error(std::current_exception());
      return;
    }
    if (obs.on_completed) obs.on_completed();
  }

  typename std::vector<slot>::iterator find(std::uint64_t id) {
    return std::find_if(slots_.begin(), slots_.end(), [id](const slot& s) { return s.id == id; });
  }

  task<T> task_;
  std::mutex m_;
  std::vector<slot> slots_;
  std::uint64_t next_id_{1};
  bool done_{false};
  std::optional<T> value_;
  std::exception_ptr error_;
};

} // namespace detail

// The task's result as an observable: one item then completion, or one failure.
// Late subscribers get the result replayed.
template <class T>
observable<T> from_task(task<T> t) {
  auto st = std::make_shared<detail::task_publisher_state<T>>(std::move(t));
  st->start();
  return observable<T>::create([st](observer<T> obs, demand initial) {
    return st->subscribe(std::move(obs), initial);
  });
}

// Launches body on ex right away (see spawn) and publishes its result.
// IMPORTANT: ex must outlive the computation!
template <class F>
auto from_async(executor& ex, priority prio, F&& body) {
  return from_task(spawn(ex, prio, std::forward<F>(body)));
}

template <class F>
auto from_async(executor& ex, F&& body) {
  return from_task(spawn(ex, priority{}, std::forward<F>(body)));
}

} // namespace relay
