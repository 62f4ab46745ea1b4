#include "grace/util/Logger.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace grace::util {

static thread_local std::vector<Field> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) { case LogLevel::Trace: return "TRACE";
               case LogLevel::Debug: return "DEBUG";
               case LogLevel::Info:  return "INFO";
               case LogLevel::Warn:  return "WARN";
               case LogLevel::Error: return "ERROR"; }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x=s; for (auto& c:x) c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x=="trace") return LogLevel::Trace;
  if (x=="debug") return LogLevel::Debug;
  if (x=="info")  return LogLevel::Info;
  if (x=="warn" || x=="warning") return LogLevel::Warn;
  if (x=="error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = nullptr;
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  if (file_ && file_ != stdout) std::fclose(static_cast<FILE*>(file_));
  file_ = path.empty() ? stdout : static_cast<void*>(std::fopen(path.c_str(), "a"));
  if (!file_) {
    file_ = stdout;
    return false;
  }
  return true;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  writeLine(lvl, msg, fields);
}

void Logger::flush() {
  std::lock_guard<std::mutex> lk(mx_);
  std::fflush(static_cast<FILE*>(file_ ? file_ : stdout));
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

void Logger::writeLine(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  std::lock_guard<std::mutex> lk(mx_);
  FILE* f = static_cast<FILE*>(file_ ? file_ : stdout);

  if (json_) {
    rapidjson::StringBuffer buf;
    rapidjson::Writer<rapidjson::StringBuffer> w(buf);
    w.StartObject();
    w.Key("ts");  w.String(nowIso().c_str());
    w.Key("lvl"); w.String(levelName(lvl));
    w.Key("msg"); w.String(msg.c_str(), static_cast<rapidjson::SizeType>(msg.size()));
    for (auto& kv : t_ctx) {
      w.Key(kv.k.c_str(), static_cast<rapidjson::SizeType>(kv.k.size()));
      w.String(kv.v.c_str(), static_cast<rapidjson::SizeType>(kv.v.size()));
    }
    for (auto& kv : fields) {
      w.Key(kv.k.c_str(), static_cast<rapidjson::SizeType>(kv.k.size()));
      w.String(kv.v.c_str(), static_cast<rapidjson::SizeType>(kv.v.size()));
    }
    w.EndObject();
    std::fwrite(buf.GetString(), 1, buf.GetSize(), f);
    std::fputc('\n', f);
  } else {
    std::fprintf(f, "[%s] %-5s %s", nowIso().c_str(), levelName(lvl), msg.c_str());
    for (auto& kv : t_ctx) std::fprintf(f, " %s=%s", kv.k.c_str(), kv.v.c_str());
    for (auto& kv : fields) std::fprintf(f, " %s=%s", kv.k.c_str(), kv.v.c_str());
    std::fputc('\n', f);
  }
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) : added_(add.size()) {
  t_ctx.insert(t_ctx.end(), add.begin(), add.end());
}

Logger::Scoped::~Scoped() {
  // Scopes nest on one thread, so ours are always the last entries.
  t_ctx.resize(t_ctx.size() - added_);
}

} // namespace grace::util
