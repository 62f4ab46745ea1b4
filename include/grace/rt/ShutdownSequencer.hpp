#pragma once

#include "grace/rt/Completion.hpp"
#include "grace/rt/IDrainable.hpp"
#include "grace/rt/ResourceCleaner.hpp"
#include "grace/rt/SignalSource.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace grace::rt {

// Drives the shutdown of a process:
//
//   Running -> ShuttingDown -> CleaningUp -> Done
//   Running -> ShuttingDown -> Aborted        (drain did not finish in time)
//
// The first signal from the source starts the sequence; later signals are
// logged and ignored. Drain and cleanup each get their own Deadline, so a
// slow drain never shortens the cleanup budget.
class ShutdownSequencer {
public:
  enum class State : int { Running, ShuttingDown, CleaningUp, Done, Aborted };

  struct Options {
    std::chrono::milliseconds shutdownTimeout{30000};
    std::chrono::milliseconds cleanupTimeout{30000};
    // Run cleanup before the fatal handler when the drain times out.
    bool cleanupOnDrainTimeout = false;
  };

  // Called when the drain fails. The default flushes the logger and
  // terminates the process with EXIT_FAILURE.
  using FatalHandler = std::function<void(const std::string& reason)>;

  ShutdownSequencer(SignalSource& signals,
                    IDrainable& server,
                    ResourceCleaner& cleaner,
                    Options opts,
                    FatalHandler onFatal = {});
  ~ShutdownSequencer();

  ShutdownSequencer(const ShutdownSequencer&)            = delete;
  ShutdownSequencer& operator=(const ShutdownSequencer&) = delete;

  // Arm the signal source and start the driver thread. Call before serving.
  void arm();

  // Block until the sequence reaches Done.
  void wait() const { done_.wait(); }

  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> d) const { return done_.waitFor(d); }

  State state() const { return state_.load(std::memory_order_acquire); }

  // Signal that started the sequence, 0 if none yet.
  int triggeredBy() const;

private:
  void onSignal(int signal);
  void drive();
  void runCleanup();

private:
  SignalSource&    signals_;
  IDrainable&      server_;
  ResourceCleaner& cleaner_;
  Options          opts_;
  FatalHandler     onFatal_;

  mutable std::mutex      mx_;
  std::condition_variable cv_;
  int                     signal_{0};
  bool                    stopping_{false};

  std::atomic<State> state_{State::Running};
  Completion         done_;
  std::thread        driver_;
};

const char* stateName(ShutdownSequencer::State s);

} // namespace grace::rt
