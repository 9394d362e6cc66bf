#pragma once
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay {

// Pull-based producer: yields its next element only when asked.
// next() may block; an empty optional means exhausted, an exception means failure.
// Sequences are copied per subscription, so a copy must start from the beginning.
template <class S>
concept pull_sequence = std::copy_constructible<S> && requires(S& s) {
  typename S::value_type;
  { s.next() } -> std::same_as<std::optional<typename S::value_type>>;
};

// Sequences that can be woken up when the consumer loses interest.
template <class S>
concept stoppable_pull_sequence = pull_sequence<S> && requires(S& s, std::stop_token t) {
  { s.next(t) } -> std::same_as<std::optional<typename S::value_type>>;
};

// Pulls one item, handing over the token when the sequence takes one.
template <pull_sequence S>
std::optional<typename S::value_type> pull_next(S& s, std::stop_token token) {
  if constexpr (stoppable_pull_sequence<S>) {
    return s.next(std::move(token));
  } else {
    return s.next();
  }
}

// Items of a vector, in order.
template <class T>
class vector_sequence {
public:
  using value_type = T;

  explicit vector_sequence(std::vector<T> items)
    : items_(std::make_shared<const std::vector<T>>(std::move(items))) {}

  std::optional<T> next() {
    if (pos_ >= items_->size()) return std::nullopt;
    return (*items_)[pos_++];
  }

private:
  std::shared_ptr<const std::vector<T>> items_;
  std::size_t pos_{0};
};

template <class T>
inline vector_sequence<T> sequence_of(std::vector<T> items) {
  return vector_sequence<T>(std::move(items));
}

// Items produced by a callable. Copies share the callable (and whatever it captured).
template <class T>
class function_sequence {
public:
  using value_type = T;

  explicit function_sequence(std::function<std::optional<T>()> fn)
    : fn_(std::make_shared<std::function<std::optional<T>()>>(std::move(fn))) {}

  std::optional<T> next() { return (*fn_)(); }

private:
  std::shared_ptr<std::function<std::optional<T>()>> fn_;
};

template <class T, class F>
inline function_sequence<T> generate(F&& fn) {
  return function_sequence<T>(std::function<std::optional<T>()>(std::forward<F>(fn)));
}

} // namespace relay
