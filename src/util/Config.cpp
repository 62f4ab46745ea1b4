#include "grace/util/Config.hpp"
#include "grace/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace grace {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

std::optional<std::chrono::milliseconds> Config::parseDuration(const std::string& raw) {
  const std::string s = trim(raw);
  if (s.empty()) return std::nullopt;

  std::size_t i = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  if (i == 0) return std::nullopt;

  const std::string digits = s.substr(0, i);
  const std::string unit   = s.substr(i);
  if (digits.size() > 12) return std::nullopt;
  const long long n = std::atoll(digits.c_str());

  if (unit.empty() || unit == "ms") return std::chrono::milliseconds(n);
  if (unit == "s")  return std::chrono::milliseconds(n * 1000);
  if (unit == "m")  return std::chrono::milliseconds(n * 60 * 1000);
  return std::nullopt;
}

static std::optional<bool> parseBool(const std::string& v) {
  std::string x = v; for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "1" || x == "true"  || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no"  || x == "off") return false;
  return std::nullopt;
}

bool Config::set(const std::string& key, const std::string& val) {
  if (key == "host") {
    if (val.empty()) return false;
    host = val;
  } else if (key == "port") {
    char* end = nullptr;
    const long p = std::strtol(val.c_str(), &end, 10);
    if (val.empty() || *end != '\0' || p < 0 || p > std::numeric_limits<unsigned short>::max()) return false;
    port = static_cast<unsigned short>(p);
  } else if (key == "ioThreads") {
    ioThreads = static_cast<unsigned>(std::max(1, std::atoi(val.c_str())));
  } else if (key == "shutdownTimeout" || key == "cleanupTimeout") {
    auto d = parseDuration(val);
    if (!d || *d > MaxTimeout) return false;
    (key == "shutdownTimeout" ? shutdownTimeout : cleanupTimeout) = *d;
  } else if (key == "cleanupOnDrainTimeout") {
    auto b = parseBool(val);
    if (!b) return false;
    cleanupOnDrainTimeout = *b;
  } else if (key == "logLevel") {
    logLevel = val;
  } else if (key == "logFormat") {
    if (val != "text" && val != "json") return false;
    logFormat = val;
  } else if (key == "logFile") {
    logFile = val;
  } else if (key == "traceFile") {
    traceFile = val;
  } else if (key == "seedFile") {
    seedFile = val;
  } else {
    return false;
  }
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!set(key, val)) {
      logger().log(LogLevel::Warn, "config.key.ignored", {{"key", key}, {"value", val}});
    }
  }

  std::fclose(f);
  return true;
}

std::chrono::milliseconds Config::effectiveShutdownTimeout() const {
  return shutdownTimeout.count() > 0 ? shutdownTimeout : DefaultShutdownTimeout;
}

std::chrono::milliseconds Config::effectiveCleanupTimeout() const {
  return cleanupTimeout.count() > 0 ? cleanupTimeout : effectiveShutdownTimeout();
}

} // namespace util
} // namespace grace
