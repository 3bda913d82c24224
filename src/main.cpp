/* @file main.cpp
 * @brief hyprdock entry point - config, logging, CLI dispatch
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>

// HyprDock headers
#include "core/ActionRegistry.hpp"
#include "core/CliOptions.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DockDaemon.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/ProcessRunner.hpp"

namespace {
  constexpr const char* kVersion = "0.2.1";

  void printHelp(const hyprdock::core::ActionRegistry& registry) {
    std::cout << "Usage: hyprdock [--config <path>] [--verbose] <action>...\n"
              << "Possible arguments are:\n"
              << registry.helpText()
              << "  --print-config/-p   Print the effective configuration as JSON\n"
              << "  --config/-c <path>  Use <path> instead of ~/.config/hypr/hyprdock.json\n"
              << "  --verbose           Log every spawned command\n"
              << "  --help/-h           Shows options\n"
              << "  --version/-v        Shows version\n";
  }
} // namespace

int main(int argc, char** argv) {
  using namespace hyprdock;

  core::Logger log;
  auto errorMonitor = std::make_shared<core::ErrorMonitor>();
  errorMonitor->registerEscalation(
      [&log](const std::string& reason) { log.fatal("hyprdock", reason); });

  core::CliOptions opts;
  try {
    opts = core::CliOptions::parse(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
  if (opts.verbose)
    log.setThreshold(core::LogLevel::Debug);

  try {
    if (!opts.needsConfig()) {
      // usage only: describe the actions against the built-in defaults, no config file read
      core::DockDaemon idle(core::MonitorConfig::defaults(),
                            std::make_unique<io::ProcessRunner>(errorMonitor, log), errorMonitor,
                            log);
      core::ActionRegistry registry;
      idle.registerActions(registry);
      printHelp(registry);
      return EXIT_SUCCESS;
    }

    core::ConfigLoader loader(opts.configPath ? *opts.configPath
                                              : core::ConfigLoader::defaultPath());
    core::MonitorConfig config = loader.loadConfig();

    if (!config.logFile.empty() && !log.openFile(config.logFile))
      log.warning("hyprdock", "cannot open log file " + config.logFile);

    core::DockDaemon daemon(std::move(config),
                            std::make_unique<io::ProcessRunner>(errorMonitor, log),
                            errorMonitor, log);
    core::ActionRegistry registry;
    daemon.registerActions(registry);

    for (const auto& action : opts.actions) {
      if (action == "--help" || action == "-h") {
        printHelp(registry);
        return EXIT_SUCCESS;
      } else if (action == "--version" || action == "-v") {
        std::cout << kVersion << '\n';
      } else if (action == "--print-config" || action == "-p") {
        std::cout << daemon.config().toJson().dump(2) << '\n';
      } else if (registry.contains(action)) {
        registry.invoke(action);
      } else {
        std::cout << "Could not parse " << action << '\n';
        printHelp(registry);
        return EXIT_SUCCESS;
      }
    }
  } catch (const std::exception& e) {
    // no-op for faults a subsystem already escalated
    errorMonitor->notifyFailure(e.what());
    log.flush();
    return EXIT_FAILURE;
  }

  log.flush();
  return EXIT_SUCCESS;
}
