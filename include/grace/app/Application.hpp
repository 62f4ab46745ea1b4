#pragma once

#include "grace/app/SeedService.hpp"
#include "grace/rt/ResourceCleaner.hpp"
#include "grace/rt/ShutdownSequencer.hpp"
#include "grace/rt/SignalSource.hpp"
#include "grace/server/HttpServer.hpp"
#include "grace/trace/Tracer.hpp"
#include "grace/util/Config.hpp"

#include <memory>

namespace grace::app {

// Wires configuration, the HTTP server and its collaborators together and
// hands control to the ShutdownSequencer.
class Application {
public:
  Application(util::Config cfg,
              std::unique_ptr<rt::SignalSource> signals,
              rt::ShutdownSequencer::FatalHandler onFatal = {});

  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  // Apply logLevel/logFormat/logFile (and GRACE_MODE) to the global logger.
  static void configureLogging(const util::Config& cfg);

  // Register cleanup actions, seed, arm the sequencer and bind.
  // Throws boost::system::system_error if the listener cannot be bound, or
  // with operation_aborted if a signal already shut the server down.
  void start();

  // Block until the shutdown sequence is done.
  void wait() { sequencer_.wait(); }

  // start() + wait(); returns the process exit code.
  int run();

  const util::Config&    config() const { return cfg_; }
  rt::ResourceCleaner&   cleaner() { return cleaner_; }
  server::HttpServer&    server() { return server_; }
  trace::Tracer&         tracer() { return *tracer_; }
  rt::ShutdownSequencer& sequencer() { return sequencer_; }

private:
  util::Config                      cfg_;
  std::unique_ptr<rt::SignalSource> signals_;
  rt::ResourceCleaner               cleaner_;
  std::shared_ptr<trace::Tracer>    tracer_;
  std::unique_ptr<SeedService>      seeds_;
  server::HttpServer                server_;
  rt::ShutdownSequencer             sequencer_;
};

} // namespace grace::app
