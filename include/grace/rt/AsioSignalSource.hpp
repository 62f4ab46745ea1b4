#pragma once

#include "grace/rt/SignalSource.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <thread>

namespace grace::rt {

// SIGINT, SIGTERM and SIGHUP via boost::asio::signal_set.
// Signals are captured from construction on; arm() starts delivering them
// on a dedicated thread.
class AsioSignalSource : public SignalSource {
public:
  AsioSignalSource();
  ~AsioSignalSource() override;

  AsioSignalSource(const AsioSignalSource&)            = delete;
  AsioSignalSource& operator=(const AsioSignalSource&) = delete;

  void arm(Callback cb) override;
  void disarm() noexcept override;

private:
  void doWait();

private:
  boost::asio::io_context ioc_;
  boost::asio::signal_set signals_;
  Callback                cb_;
  std::thread             thr_;
  std::atomic<bool>       armed_{false};
};

} // namespace grace::rt
