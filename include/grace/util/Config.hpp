#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace grace {
namespace util {

class Config {
public:
  static constexpr std::chrono::milliseconds DefaultShutdownTimeout{30000};
  // Upper bound accepted for shutdownTimeout/cleanupTimeout (24 h).
  static constexpr std::chrono::milliseconds MaxTimeout{24 * 60 * 60 * 1000};

  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply a single key/value pair. Returns false for unknown keys or
  // values that do not parse; the previous value is kept in that case.
  bool set(const std::string& key, const std::string& value);

  // --- Server ---
  std::string    host = "0.0.0.0";
  unsigned short port = 8080;
  unsigned       ioThreads = 2;

  // --- Shutdown budgets (zero means "use the default") ---
  std::chrono::milliseconds shutdownTimeout{0};
  std::chrono::milliseconds cleanupTimeout{0};
  bool cleanupOnDrainTimeout = false;

  // --- Logging ---
  std::string logLevel;             // empty -> from GRACE_MODE (release: info, else debug)
  std::string logFormat = "text";   // "text" | "json"
  std::string logFile;              // empty -> stdout

  // --- Collaborators ---
  std::string traceFile;            // empty -> spans go to the logger
  std::string seedFile;             // empty -> seeding disabled

  // Drain budget with the 30 s fallback applied.
  std::chrono::milliseconds effectiveShutdownTimeout() const;
  // Cleanup budget; falls back to the effective shutdown timeout.
  std::chrono::milliseconds effectiveCleanupTimeout() const;

  // "250ms", "5s", "2m" or a bare number of milliseconds.
  static std::optional<std::chrono::milliseconds> parseDuration(const std::string& s);

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace grace
