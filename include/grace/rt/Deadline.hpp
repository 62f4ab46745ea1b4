#pragma once

#include <chrono>

namespace grace::rt {

// A point in time after which a phase must stop waiting.
// Each shutdown phase allocates its own Deadline.
class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(Clock::time_point at) : at_(at) {}

  // Budgets longer than MaxSpan are clamped so now() + d cannot overflow
  // the clock's representation (or a later conversion to system_clock).
  static constexpr std::chrono::hours MaxSpan{24 * 365 * 100};

  template <class Rep, class Period>
  static Deadline after(std::chrono::duration<Rep, Period> d) {
    using In = std::chrono::duration<Rep, Period>;
    if (d >= std::chrono::duration_cast<In>(MaxSpan)) {
      return Deadline(Clock::now() + std::chrono::duration_cast<Clock::duration>(MaxSpan));
    }
    return Deadline(Clock::now() + std::chrono::duration_cast<Clock::duration>(d));
  }

  Clock::time_point timePoint() const { return at_; }

  bool expired() const { return Clock::now() >= at_; }

  Clock::duration remaining() const {
    auto now = Clock::now();
    return now >= at_ ? Clock::duration::zero() : at_ - now;
  }

private:
  Clock::time_point at_;
};

} // namespace grace::rt
