#include "grace/rt/ResourceCleaner.hpp"
#include "grace/util/Logger.hpp"
#include "grace/util/Metrics.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <optional>
#include <thread>

namespace grace::rt {

using util::logger;
using util::LogLevel;

namespace {

constexpr std::size_t kNotStarted = static_cast<std::size_t>(-1);

// State shared between cleanup() and its worker. The worker may outlive the
// call when an action hangs past the deadline.
struct CleanupRun {
  struct Outcome {
    bool finished{false};
    std::optional<Error> error;
  };

  std::mutex              mx;
  std::condition_variable cv;
  std::vector<std::pair<std::string, ResourceCleaner::Action>> steps;
  std::vector<Outcome>    outcomes;
  std::size_t             running{kNotStarted};
  bool                    abandoned{false};
  bool                    done{false};
};

Status invoke(const ResourceCleaner::Action& fn) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    return Status::failure(std::string("exception: ") + ex.what());
  } catch (...) {
    return Status::failure("exception: unknown");
  }
}

void runSteps(const std::shared_ptr<CleanupRun>& run) {
  for (std::size_t i = 0; i < run->steps.size(); ++i) {
    {
      std::lock_guard<std::mutex> lk(run->mx);
      if (run->abandoned) break;
      run->running = i;
    }

    Status st = invoke(run->steps[i].second);

    {
      std::lock_guard<std::mutex> lk(run->mx);
      auto& out = run->outcomes[i];
      out.finished = true;
      if (!st.ok()) out.error = Error{st.error().message, run->steps[i].first};
      run->running = kNotStarted;
    }
    run->cv.notify_all();
  }

  {
    std::lock_guard<std::mutex> lk(run->mx);
    run->done = true;
  }
  run->cv.notify_all();
}

} // namespace

bool ResourceCleaner::registerWithName(std::string name, Action action) {
  std::lock_guard<std::mutex> lk(mx_);
  if (consumed_.load(std::memory_order_acquire)) {
    logger().log(LogLevel::Warn, "cleanup.register.rejected",
                 {{"name", name}, {"reason", "cleanup already started"}});
    return false;
  }

  const bool dup = std::any_of(steps_.begin(), steps_.end(),
                               [&](const Step& s){ return s.name == name; });
  if (dup) {
    logger().log(LogLevel::Warn, "cleanup.register.ambiguous_name", {{"name", name}});
  }

  logger().log(LogLevel::Debug, "cleanup.register", {{"name", name}});
  steps_.push_back({std::move(name), std::move(action)});
  return true;
}

std::size_t ResourceCleaner::size() const {
  std::lock_guard<std::mutex> lk(mx_);
  return steps_.size();
}

std::vector<Error> ResourceCleaner::cleanup(const Deadline& deadline) {
  auto run = std::make_shared<CleanupRun>();
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (consumed_.exchange(true, std::memory_order_acq_rel)) {
      return {Error{"registry already consumed", "ResourceCleaner"}};
    }
    run->steps.reserve(steps_.size());
    for (auto& s : steps_) run->steps.emplace_back(std::move(s.name), std::move(s.fn));
    steps_.clear();
  }
  run->outcomes.resize(run->steps.size());

  logger().log(LogLevel::Info, "cleanup.begin", {{"actions", std::to_string(run->steps.size())}});

  std::thread(runSteps, run).detach();

  std::vector<Error> errs;
  std::unique_lock<std::mutex> lk(run->mx);
  const bool finished = run->cv.wait_until(lk, deadline.timePoint(), [&]{ return run->done; });
  if (!finished) run->abandoned = true;

  for (std::size_t i = 0; i < run->steps.size(); ++i) {
    const auto& out  = run->outcomes[i];
    const auto& name = run->steps[i].first;
    if (out.finished) {
      if (out.error) errs.push_back(*out.error);
    } else if (i == run->running) {
      errs.push_back(Error{"deadline exceeded", name});
    } else {
      errs.push_back(Error{"skipped: deadline exceeded", name});
    }
  }
  lk.unlock();

  GRACE_METRIC_INC("cleanup.failed", static_cast<double>(errs.size()));
  for (const auto& e : errs) {
    logger().log(LogLevel::Warn, "cleanup.action.failed", {{"name", e.path}, {"error", e.message}});
  }
  logger().log(finished ? LogLevel::Info : LogLevel::Warn, "cleanup.end",
               {{"failed", std::to_string(errs.size())},
                {"timed_out", finished ? "false" : "true"}});
  return errs;
}

} // namespace grace::rt
