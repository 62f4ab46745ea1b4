#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace grace::rt {

// One-shot completion latch. fire() releases every waiter; only the first
// call has an effect.
class Completion {
public:
  Completion() = default;

  Completion(const Completion&)            = delete;
  Completion& operator=(const Completion&) = delete;

  // Returns true for the call that actually fired.
  bool fire() {
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (fired_) return false;
      fired_ = true;
    }
    cv_.notify_all();
    return true;
  }

  bool fired() const {
    std::lock_guard<std::mutex> lk(mx_);
    return fired_;
  }

  void wait() const {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [this]{ return fired_; });
  }

  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(mx_);
    return cv_.wait_for(lk, d, [this]{ return fired_; });
  }

private:
  mutable std::mutex              mx_;
  mutable std::condition_variable cv_;
  bool                            fired_{false};
};

} // namespace grace::rt
