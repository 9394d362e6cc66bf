#pragma once
#include <cstddef>
#include <limits>

namespace relay {

// ── DEMAND ───────────────────────────────────────────────────────────────────────
// How many more items a consumer is willing to accept.
// Either a finite count or "unlimited". Never negative.
class demand {
public:
  constexpr demand() noexcept = default;
  constexpr explicit demand(std::size_t n) noexcept : count_(n) {}

  static constexpr demand none() noexcept { return demand{}; }
  static constexpr demand max(std::size_t n) noexcept { return demand{n}; }
  static constexpr demand unlimited() noexcept {
    demand d;
    d.unlimited_ = true;
    return d;
  }

  constexpr bool is_unlimited() const noexcept { return unlimited_; }
  constexpr bool is_none() const noexcept { return !unlimited_ && count_ == 0; }

  // Only meaningful when !is_unlimited().
  constexpr std::size_t count() const noexcept { return count_; }

  // Saturating: unlimited absorbs everything, overflow turns into unlimited.
  constexpr demand& operator+=(demand other) noexcept {
    if (unlimited_) return *this;
    if (other.unlimited_ ||
        count_ > std::numeric_limits<std::size_t>::max() - other.count_) {
      unlimited_ = true;
      count_ = 0;
      return *this;
    }
    count_ += other.count_;
    return *this;
  }

  friend constexpr demand operator+(demand a, demand b) noexcept { return a += b; }

  friend constexpr bool operator==(demand a, demand b) noexcept {
    if (a.unlimited_ || b.unlimited_) return a.unlimited_ == b.unlimited_;
    return a.count_ == b.count_;
  }

private:
  std::size_t count_{0};
  bool unlimited_{false};
};

// ── DEMAND TRACKER ───────────────────────────────────────────────────────────────
// Outstanding demand of one subscription.
// NOT synchronized on its own: every call must happen under the mutex of the
// owning subscription (the same one that guards its buffer).
class demand_tracker {
public:
  demand_tracker() = default;
  explicit demand_tracker(demand initial) : d_(initial) {}

  void increment(demand by) noexcept { d_ += by; }

  // Takes one unit. false when nothing is outstanding; unlimited never runs out.
  bool try_consume_one() noexcept {
    if (d_.is_unlimited()) return true;
    if (d_.count() == 0) return false;
    d_ = demand{d_.count() - 1};
    return true;
  }

  bool has_demand() const noexcept { return !d_.is_none(); }
  demand current() const noexcept { return d_; }

private:
  demand d_{};
};

} // namespace relay
