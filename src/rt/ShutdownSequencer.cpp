#include "grace/rt/ShutdownSequencer.hpp"
#include "grace/util/Logger.hpp"

#include <cstdlib>
#include <utility>
#include <vector>

namespace grace::rt {

using util::logger;
using util::LogLevel;

namespace {

void terminateProcess(const std::string& reason) {
  logger().log(LogLevel::Error, "shutdown.fatal", {{"reason", reason}});
  logger().flush();
  std::_Exit(EXIT_FAILURE);
}

std::string millis(std::chrono::milliseconds d) {
  return std::to_string(d.count()) + "ms";
}

} // namespace

const char* stateName(ShutdownSequencer::State s) {
  switch (s) {
    case ShutdownSequencer::State::Running:      return "running";
    case ShutdownSequencer::State::ShuttingDown: return "shutting_down";
    case ShutdownSequencer::State::CleaningUp:   return "cleaning_up";
    case ShutdownSequencer::State::Done:         return "done";
    case ShutdownSequencer::State::Aborted:      return "aborted";
  }
  return "unknown";
}

ShutdownSequencer::ShutdownSequencer(SignalSource& signals,
                                     IDrainable& server,
                                     ResourceCleaner& cleaner,
                                     Options opts,
                                     FatalHandler onFatal)
  : signals_(signals)
  , server_(server)
  , cleaner_(cleaner)
  , opts_(opts)
  , onFatal_(onFatal ? std::move(onFatal) : FatalHandler(terminateProcess))
{}

ShutdownSequencer::~ShutdownSequencer() {
  signals_.disarm();
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (driver_.joinable()) driver_.join();
}

void ShutdownSequencer::arm() {
  if (driver_.joinable()) return;
  driver_ = std::thread([this]{ drive(); });
  signals_.arm([this](int signal){ onSignal(signal); });
  logger().log(LogLevel::Debug, "shutdown.armed",
               {{"shutdown_timeout", millis(opts_.shutdownTimeout)},
                {"cleanup_timeout", millis(opts_.cleanupTimeout)}});
}

int ShutdownSequencer::triggeredBy() const {
  std::lock_guard<std::mutex> lk(mx_);
  return signal_;
}

void ShutdownSequencer::onSignal(int signal) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (signal_ != 0) {
      logger().log(LogLevel::Warn, "shutdown.signal.ignored",
                   {{"signal", signalName(signal)}, {"state", stateName(state())}});
      return;
    }
    signal_ = signal;
  }
  cv_.notify_all();
}

void ShutdownSequencer::drive() {
  int signal = 0;
  {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [this]{ return signal_ != 0 || stopping_; });
    if (signal_ == 0) return;
    signal = signal_;
  }

  logger().log(LogLevel::Info, "shutdown.signal", {{"signal", signalName(signal)}});

  state_.store(State::ShuttingDown, std::memory_order_release);
  boost::system::error_code ec;
  {
    util::Logger::Scoped phase(std::vector<util::Field>{{"phase", "drain"}});
    logger().log(LogLevel::Info, "shutdown.drain.begin", {{"timeout", millis(opts_.shutdownTimeout)}});
    ec = server_.shutdown(Deadline::after(opts_.shutdownTimeout));
    if (ec) {
      logger().log(LogLevel::Error, "shutdown.drain.failed",
                   {{"timeout", millis(opts_.shutdownTimeout)}, {"error", ec.message()}});
    } else {
      logger().log(LogLevel::Info, "shutdown.drain.end");
    }
  }

  if (ec) {
    const std::string reason = "server drain failed after " + millis(opts_.shutdownTimeout)
                             + ": " + ec.message();
    if (opts_.cleanupOnDrainTimeout) {
      state_.store(State::CleaningUp, std::memory_order_release);
      runCleanup();
    }
    state_.store(State::Aborted, std::memory_order_release);
    onFatal_(reason);
    return;
  }

  state_.store(State::CleaningUp, std::memory_order_release);
  runCleanup();

  state_.store(State::Done, std::memory_order_release);
  logger().log(LogLevel::Info, "shutdown.done");
  done_.fire();
}

void ShutdownSequencer::runCleanup() {
  util::Logger::Scoped phase(std::vector<util::Field>{{"phase", "cleanup"}});
  logger().log(LogLevel::Info, "shutdown.cleanup.begin", {{"timeout", millis(opts_.cleanupTimeout)}});
  const auto errs = cleaner_.cleanup(Deadline::after(opts_.cleanupTimeout));
  if (!errs.empty()) {
    std::string all;
    for (const auto& e : errs) {
      if (!all.empty()) all += "; ";
      all += e.describe();
    }
    logger().log(LogLevel::Warn, "shutdown.cleanup.errors",
                 {{"count", std::to_string(errs.size())}, {"errors", all}});
  }
}

} // namespace grace::rt
