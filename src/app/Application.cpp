#include "grace/app/Application.hpp"
#include "grace/app/Router.hpp"
#include "grace/util/Logger.hpp"

#include <boost/asio/error.hpp>

#include <cstdlib>
#include <utility>

namespace grace::app {

using util::logger;
using util::LogLevel;

static rt::ShutdownSequencer::Options sequencerOptions(const util::Config& cfg) {
  rt::ShutdownSequencer::Options o;
  o.shutdownTimeout       = cfg.effectiveShutdownTimeout();
  o.cleanupTimeout        = cfg.effectiveCleanupTimeout();
  o.cleanupOnDrainTimeout = cfg.cleanupOnDrainTimeout;
  return o;
}

Application::Application(util::Config cfg,
                         std::unique_ptr<rt::SignalSource> signals,
                         rt::ShutdownSequencer::FatalHandler onFatal)
  : cfg_(std::move(cfg))
  , signals_(std::move(signals))
  , tracer_(std::make_shared<trace::Tracer>(cfg_.traceFile))
  , seeds_(cfg_.seedFile.empty() ? nullptr : std::make_unique<SeedService>(cfg_.seedFile))
  , server_(cfg_.ioThreads)
  , sequencer_(*signals_, server_, cleaner_, sequencerOptions(cfg_), std::move(onFatal))
{}

void Application::configureLogging(const util::Config& cfg) {
  auto& log = logger();

  std::string level = cfg.logLevel;
  if (level.empty()) {
    const char* mode = std::getenv("GRACE_MODE");
    level = (mode && std::string(mode) == "release") ? "info" : "debug";
  }
  log.setLevel(util::parseLevel(level));
  log.setFormatJson(cfg.logFormat == "json");

  if (!cfg.logFile.empty() && !log.setFile(cfg.logFile)) {
    log.log(LogLevel::Warn, "log.file.unavailable", {{"path", cfg.logFile}});
  }
}

void Application::start() {
  const auto cleanupTimeout = cfg_.effectiveCleanupTimeout();
  // The action owns a reference: a flush stuck past the cleanup deadline
  // keeps running on the cleaner's worker after we are gone.
  cleaner_.registerWithName("Tracer", [tracer = tracer_, cleanupTimeout] {
    return tracer->cleanup(rt::Deadline::after(cleanupTimeout));
  });

  if (seeds_) {
    auto loaded = seeds_->initialize();
    if (!loaded) {
      logger().log(LogLevel::Warn, "seed.failed", {{"error", loaded.error().describe()}});
    } else {
      logger().log(LogLevel::Info, "seed.loaded", {{"documents", std::to_string(*loaded)}});
    }
  }

  sequencer_.arm();
  server_.start(cfg_.host, cfg_.port, makeRoutes(*tracer_, seeds_.get()));
}

int Application::run() {
  try {
    start();
  } catch (const boost::system::system_error& ex) {
    if (ex.code() == boost::asio::error::operation_aborted) {
      // A signal latched during boot already drained the unstarted server.
      logger().log(LogLevel::Info, "app.start.cancelled");
      wait();
      logger().log(LogLevel::Info, "app.exited");
      return EXIT_SUCCESS;
    }
    logger().log(LogLevel::Error, "app.start.failed",
                 {{"address", cfg_.host + ":" + std::to_string(cfg_.port)}, {"error", ex.what()}});
    return EXIT_FAILURE;
  }

  const auto ep = server_.localEndpoint();
  logger().log(LogLevel::Info, "app.running",
               {{"address", ep.address().to_string()}, {"port", std::to_string(ep.port())}});

  wait();
  logger().log(LogLevel::Info, "app.exited");
  return EXIT_SUCCESS;
}

} // namespace grace::app
