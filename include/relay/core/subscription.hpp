#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <relay/core/demand.hpp>
#include <relay/core/log.hpp>

namespace relay {

// RAII handle of a live subscription.
// - request(n) signals more demand to the source.
// - reset() cancels; the destructor cancels too (can be disabled).
// - Copying is PROHIBITED (one subscription - one owner), moving transfers both rights.
class subscription {
public:
  using cancel_fn  = std::function<void()>;
  using request_fn = std::function<void(demand)>;

  // Creates an empty subscription.
  subscription() noexcept = default;

  // Cancel-only source: request() is a no-op.
  explicit subscription(cancel_fn fn, bool cancel_on_dtor = true) noexcept
    : cancel_(std::move(fn)), cancel_on_dtor_(cancel_on_dtor) {}

  // Demand-aware source.
  subscription(cancel_fn cancel, request_fn request, bool cancel_on_dtor = true) noexcept
    : cancel_(std::move(cancel))
    , request_(std::move(request))
    , cancel_on_dtor_(cancel_on_dtor) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::move(other.cancel_))
    , request_(std::move(other.request_))
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.cancel_ = nullptr;
    other.request_ = nullptr;
    other.cancel_on_dtor_ = false;
  }

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::move(other.cancel_);
      request_ = std::move(other.request_);
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.cancel_ = nullptr;
      other.request_ = nullptr;
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subscription() {
    if (cancel_on_dtor_) reset();
  }

  // Ask the source for n more items. No-op once cancelled.
  void request(demand n) const {
    if (request_) request_(n);
  }

  // Unsubscribes once. Repeated calls are no-op.
  void reset() noexcept {
    request_ = nullptr;
    if (cancel_) {
      auto fn = std::move(cancel_);
      cancel_ = nullptr;
      // reset() runs from destructors, so a throwing cancel hook is reported, not rethrown
      try {
        fn();
      } catch (const std::exception& e) {
        log::logger()->warn("subscription cancel hook threw: {}", e.what());
      } catch (...) {
        log::logger()->warn("subscription cancel hook threw a non-std exception");
      }
    }
    cancel_on_dtor_ = false;
  }

  // Explicitly "forget" the cancellation, letting the source run on.
  // Useful if responsibility for cancellation has moved to another object.
  void release() noexcept {
    cancel_ = nullptr;
    request_ = nullptr;
    cancel_on_dtor_ = false;
  }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

private:
  cancel_fn cancel_{};
  request_fn request_{};
  bool cancel_on_dtor_{true};
};

} // namespace relay
