#pragma once

#include <functional>
#include <string>

namespace grace::rt {

// Source of termination events. Implementations latch events that arrive
// before arm() and deliver them once armed.
class SignalSource {
public:
  using Callback = std::function<void(int signal)>;

  virtual ~SignalSource() = default;

  virtual void arm(Callback cb) = 0;
  virtual void disarm() noexcept = 0;
};

// "SIGTERM" for SIGTERM, "signal 42" for anything unknown.
std::string signalName(int signal);

} // namespace grace::rt
