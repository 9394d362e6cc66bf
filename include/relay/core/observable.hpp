#pragma once
#include <functional>
#include <utility>
#include <exception>
#include <relay/core/demand.hpp>
#include <relay/core/subscription.hpp>

namespace relay {

// Consumer side of one subscription.
// on_next returns the ADDITIONAL demand granted while handling the item.
template <class T>
struct observer {
  std::function<demand(const T&)> on_next;
  std::function<void(std::exception_ptr)> on_error;
  std::function<void()> on_completed;
};

template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnErr  = std::function<void(std::exception_ptr)>;
  using OnDone = std::function<void()>;
  using Impl   = std::function<subscription(observer<T>, demand)>;

  // Factory: create observable from subscribe function.
  // The function receives the observer and its initial demand.
  static observable create(Impl impl) {
    return observable(std::move(impl));
  }

  // Subscription with explicit flow control
  subscription subscribe(observer<T> obs, demand initial) const {
    return impl_(std::move(obs), initial);
  }

  // Sink: unlimited demand
  subscription subscribe(OnNext on_next,
                         OnErr  on_err  = {},
                         OnDone on_done = {}) const {
    observer<T> obs;
    obs.on_next = [f = std::move(on_next)](const T& v) {
      if (f) f(v);
      return demand::none();
    };
    obs.on_error = std::move(on_err);
    obs.on_completed = std::move(on_done);
    return impl_(std::move(obs), demand::unlimited());
  }

private:
  explicit observable(Impl impl)
    : impl_(std::move(impl)) {}

  Impl impl_;
};

// An observable statically known never to call on_error.
// Widens implicitly to observable<T>.
template <class T>
class infallible_observable {
public:
  using value_type = T;
  using OnNext = typename observable<T>::OnNext;
  using OnDone = typename observable<T>::OnDone;

  explicit infallible_observable(observable<T> src) : src_(std::move(src)) {}

  subscription subscribe(observer<T> obs, demand initial) const {
    return src_.subscribe(std::move(obs), initial);
  }

  subscription subscribe(OnNext on_next, OnDone on_done = {}) const {
    return src_.subscribe(std::move(on_next), {}, std::move(on_done));
  }

  const observable<T>& as_observable() const noexcept { return src_; }
  operator observable<T>() const { return src_; }

private:
  observable<T> src_;
};

} // namespace relay
