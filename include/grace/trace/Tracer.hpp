#pragma once

#include "grace/Result.hpp"
#include "grace/rt/Deadline.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace grace::trace {

struct Span {
  std::string   name;
  std::int64_t  startUs{0};     // microseconds since epoch
  std::int64_t  durationUs{0};
  std::vector<std::pair<std::string, std::string>> attrs;
};

// Buffers finished spans in memory and exports them as JSON lines on
// flush. Once closed by cleanup(), further spans are dropped.
class Tracer {
public:
  static constexpr std::size_t DefaultCapacity = 4096;

  // Empty path -> spans are exported to the logger at debug level.
  explicit Tracer(std::string exportPath = {}, std::size_t capacity = DefaultCapacity);

  Tracer(const Tracer&)            = delete;
  Tracer& operator=(const Tracer&) = delete;

  void record(Span span);

  // Export buffered spans. Stops at the deadline and reports the rest as dropped.
  Status flush(const rt::Deadline& deadline);

  // Final flush, then close. Intended to be registered with the ResourceCleaner.
  Status cleanup(const rt::Deadline& deadline);

  std::size_t pending() const;
  std::size_t dropped() const;
  bool closed() const;

  // RAII helper measuring one span.
  class Scope {
  public:
    Scope(Tracer& tracer, std::string name);
    ~Scope();

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;

    void attr(std::string k, std::string v) { span_.attrs.emplace_back(std::move(k), std::move(v)); }

  private:
    Tracer& tracer_;
    Span    span_;
    std::chrono::steady_clock::time_point t0_;
  };

private:
  static std::string toJson(const Span& s);

private:
  std::string exportPath_;
  std::size_t capacity_;

  mutable std::mutex mx_;
  std::deque<Span>   spans_;
  std::size_t        dropped_{0};
  bool               closed_{false};
};

} // namespace grace::trace
