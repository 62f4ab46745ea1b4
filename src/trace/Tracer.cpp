#include "grace/trace/Tracer.hpp"
#include "grace/util/Logger.hpp"
#include "grace/util/Metrics.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

namespace grace::trace {

using util::logger;
using util::LogLevel;

Tracer::Tracer(std::string exportPath, std::size_t capacity)
  : exportPath_(std::move(exportPath))
  , capacity_(capacity == 0 ? 1 : capacity)
{}

void Tracer::record(Span span) {
  std::lock_guard<std::mutex> lk(mx_);
  if (closed_) return;
  if (spans_.size() >= capacity_) {
    spans_.pop_front();
    ++dropped_;
    GRACE_METRIC_HIT("trace.dropped");
  }
  spans_.push_back(std::move(span));
}

std::string Tracer::toJson(const Span& s) {
  rapidjson::StringBuffer buf;
  rapidjson::Writer<rapidjson::StringBuffer> w(buf);
  w.StartObject();
  w.Key("name");     w.String(s.name.c_str(), static_cast<rapidjson::SizeType>(s.name.size()));
  w.Key("start_us"); w.Int64(s.startUs);
  w.Key("dur_us");   w.Int64(s.durationUs);
  if (!s.attrs.empty()) {
    w.Key("attrs");
    w.StartObject();
    for (const auto& kv : s.attrs) {
      w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
      w.String(kv.second.c_str(), static_cast<rapidjson::SizeType>(kv.second.size()));
    }
    w.EndObject();
  }
  w.EndObject();
  return std::string(buf.GetString(), buf.GetSize());
}

Status Tracer::flush(const rt::Deadline& deadline) {
  std::deque<Span> batch;
  {
    std::lock_guard<std::mutex> lk(mx_);
    batch.swap(spans_);
  }
  if (batch.empty()) return {};

  FILE* f = nullptr;
  if (!exportPath_.empty()) {
    f = std::fopen(exportPath_.c_str(), "a");
    if (!f) {
      const std::string err = std::strerror(errno);
      std::lock_guard<std::mutex> lk(mx_);
      dropped_ += batch.size();
      return Error{"open " + exportPath_ + ": " + err, "Tracer"};
    }
  }

  std::size_t written = 0;
  for (const auto& s : batch) {
    if (deadline.expired()) break;
    const std::string line = toJson(s);
    if (f) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fputc('\n', f);
    } else {
      logger().log(LogLevel::Debug, "trace.span", {{"span", line}});
    }
    ++written;
  }
  if (f) std::fclose(f);

  GRACE_METRIC_INC("trace.exported", static_cast<double>(written));
  const std::size_t lost = batch.size() - written;
  if (lost > 0) {
    std::lock_guard<std::mutex> lk(mx_);
    dropped_ += lost;
    return Error{"deadline exceeded, " + std::to_string(lost) + " spans dropped", "Tracer"};
  }
  return {};
}

Status Tracer::cleanup(const rt::Deadline& deadline) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (closed_) return {};
    closed_ = true;
  }
  Status st = flush(deadline);
  logger().log(LogLevel::Info, "trace.closed", {{"dropped", std::to_string(dropped())}});
  return st;
}

std::size_t Tracer::pending() const {
  std::lock_guard<std::mutex> lk(mx_);
  return spans_.size();
}

std::size_t Tracer::dropped() const {
  std::lock_guard<std::mutex> lk(mx_);
  return dropped_;
}

bool Tracer::closed() const {
  std::lock_guard<std::mutex> lk(mx_);
  return closed_;
}

Tracer::Scope::Scope(Tracer& tracer, std::string name)
  : tracer_(tracer)
  , t0_(std::chrono::steady_clock::now())
{
  using namespace std::chrono;
  span_.name    = std::move(name);
  span_.startUs = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

Tracer::Scope::~Scope() {
  using namespace std::chrono;
  span_.durationUs = duration_cast<microseconds>(steady_clock::now() - t0_).count();
  tracer_.record(std::move(span_));
}

} // namespace grace::trace
