#pragma once

#include "grace/rt/Deadline.hpp"

#include <boost/system/error_code.hpp>

namespace grace::rt {

// Something that can stop taking new work and wait for work in flight.
struct IDrainable {
  virtual ~IDrainable() = default;
  // Returns boost::asio::error::timed_out if work remains at the deadline.
  virtual boost::system::error_code shutdown(const Deadline& deadline) = 0;
};

} // namespace grace::rt
