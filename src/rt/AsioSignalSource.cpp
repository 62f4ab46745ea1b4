#include "grace/rt/AsioSignalSource.hpp"
#include "grace/util/Logger.hpp"

#include <csignal>
#include <utility>

namespace grace::rt {

std::string signalName(int signal) {
  switch (signal) {
    case SIGINT:  return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP:  return "SIGHUP";
    default:      return "signal " + std::to_string(signal);
  }
}

AsioSignalSource::AsioSignalSource()
  : signals_(ioc_, SIGINT, SIGTERM, SIGHUP)
{}

AsioSignalSource::~AsioSignalSource() {
  disarm();
}

void AsioSignalSource::arm(Callback cb) {
  bool expected = false;
  if (!armed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return; // already armed
  }
  cb_ = std::move(cb);
  doWait();
  thr_ = std::thread([this]{
    try {
      ioc_.run();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "signal.loop.exception", {{"error", ex.what()}});
    }
  });
}

void AsioSignalSource::disarm() noexcept {
  ioc_.stop();
  if (thr_.joinable()) thr_.join();
}

void AsioSignalSource::doWait() {
  signals_.async_wait([this](const boost::system::error_code& ec, int signal) {
    if (ec) return; // cancelled
    if (cb_) cb_(signal);
    doWait();
  });
}

} // namespace grace::rt
