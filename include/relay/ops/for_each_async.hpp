#pragma once
#include <relay/core/observable.hpp>
#include <relay/core/scheduler.hpp>
#include <relay/core/subscription.hpp>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace relay {

// How an observable terminated
struct completion {
  std::exception_ptr error;

  bool finished() const noexcept { return !error; }
  bool failed() const noexcept { return static_cast<bool>(error); }
};

// ================================
// for_each_async(executor&, priority, on_item, on_completion)
// Unlimited demand. Every item and the completion become separate jobs on ex:
// the jobs are NOT serialized, so their bodies may run in any order.
// IMPORTANT: ex must outlive the subscription!
// ================================
template <class T>
subscription for_each_async(const observable<T>& src, executor& ex, priority prio,
                            std::type_identity_t<std::function<void(T)>> on_item,
                            std::function<void(completion)> on_completion = {}) {
  return src.subscribe(
    [&ex, prio, on_item](const T& v) {
      ex.post([on_item, v] { if (on_item) on_item(v); }, prio);
    },
    [&ex, prio, on_completion](std::exception_ptr e) {
      ex.post([on_completion, e] { if (on_completion) on_completion(completion{e}); }, prio);
    },
    [&ex, prio, on_completion] {
      ex.post([on_completion] { if (on_completion) on_completion(completion{}); }, prio);
    });
}

template <class T>
struct op_for_each_async {
  executor* ex;
  priority prio;
  std::function<void(T)> on_item;
  std::function<void(completion)> on_completion;

  subscription operator()(const observable<T>& src) const {
    return relay::for_each_async(src, *ex, prio, on_item, on_completion);
  }
};

// obs | for_each_async<T>(pool, priority{1}, on_item, on_completion)
template <class T>
inline auto for_each_async(executor& ex, priority prio, std::function<void(T)> on_item,
                           std::function<void(completion)> on_completion = {}) {
  return op_for_each_async<T>{ &ex, prio, std::move(on_item), std::move(on_completion) };
}

} // namespace relay
