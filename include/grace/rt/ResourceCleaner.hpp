#pragma once

#include "grace/Result.hpp"
#include "grace/rt/Deadline.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace grace::rt {

// Registry of named teardown actions, consumed once at shutdown.
//
// Registration is safe from any thread until cleanup() begins. cleanup()
// attempts every action in registration order on a worker thread and
// returns no later than the deadline; an action still running at that point
// is left to finish on its own and actions not yet started are skipped.
class ResourceCleaner {
public:
  using Action = std::function<Status()>;

  ResourceCleaner() = default;

  ResourceCleaner(const ResourceCleaner&)            = delete;
  ResourceCleaner& operator=(const ResourceCleaner&) = delete;

  // Returns false if cleanup has already begun.
  bool registerWithName(std::string name, Action action);

  // Failures in registration order; empty means every action succeeded.
  // Error::path holds the action name.
  std::vector<Error> cleanup(const Deadline& deadline);

  std::size_t size() const;
  bool consumed() const { return consumed_.load(std::memory_order_acquire); }

private:
  struct Step { std::string name; Action fn; };

  mutable std::mutex mx_;
  std::vector<Step>  steps_;
  std::atomic<bool>  consumed_{false};
};

} // namespace grace::rt
