#pragma once

#include <map>
#include <mutex>
#include <string>

namespace grace {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void increment(const std::string& name, double v = 1.0) {
    std::lock_guard<std::mutex> lk(mu_);
    counters_[name] += v;
  }

  void setGauge(const std::string& name, double v) {
    std::lock_guard<std::mutex> lk(mu_);
    gauges_[name] = v;
  }

  double counter(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0.0 : it->second;
  }

  // Snapshots (cheap copies) for the /metrics endpoint. Ordered so the
  // rendered output is stable.
  std::map<std::string, double> snapshotCounters() const {
    std::lock_guard<std::mutex> lk(mu_);
    return counters_;
  }

  std::map<std::string, double> snapshotGauges() const {
    std::lock_guard<std::mutex> lk(mu_);
    return gauges_;
  }

private:
  mutable std::mutex mu_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
};

} // namespace util
} // namespace grace

#define GRACE_METRIC_INC(name, d) ::grace::util::MetricRegistry::instance().increment((name), (d))
#define GRACE_METRIC_HIT(name)    ::grace::util::MetricRegistry::instance().increment((name), 1.0)
#define GRACE_METRIC_SET(name, v) ::grace::util::MetricRegistry::instance().setGauge((name), (v))
