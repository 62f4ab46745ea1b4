// File: src/main.cpp
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "grace/app/Application.hpp"
#include "grace/rt/AsioSignalSource.hpp"
#include "grace/util/Config.hpp"
#include "grace/util/Logger.hpp"

// ---------------------------
// main
//   argv[1] = port (optional)
//   argv[2] = config file path (optional)
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace grace;
  using util::LogLevel;

  util::Config cfg;

  if (argc > 2) {
    if (!cfg.loadFromFile(argv[2])) {
      std::cerr << "[config] failed to load file: " << argv[2] << "\n";
      return EXIT_FAILURE;
    }
  }
  if (argc > 1 && !cfg.set("port", argv[1])) {
    std::cerr << "Invalid port '" << argv[1] << "'\n";
    return EXIT_FAILURE;
  }

  app::Application::configureLogging(cfg);
  util::logger().log(LogLevel::Info, "boot",
                     {{"host", cfg.host}, {"port", std::to_string(cfg.port)}});

  try {
    // Signals are captured from here on, before anything listens.
    app::Application application(cfg, std::make_unique<rt::AsioSignalSource>());
    return application.run();
  } catch (const std::exception& ex) {
    util::logger().log(LogLevel::Error, "app.failed", {{"error", ex.what()}});
    return EXIT_FAILURE;
  }
}
