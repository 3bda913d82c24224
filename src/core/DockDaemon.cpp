/* @file DockDaemon.cpp
 * @brief acpid read loop + CLI action wiring
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <stdexcept>

// HyprDock headers
#include "core/ActionRegistry.hpp"
#include "core/DockDaemon.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "io/EventChannel.hpp"
#include "protocols/LidEvent.hpp"
#include "protocols/Utf8.hpp"

using namespace hyprdock::core;

namespace {
  constexpr const char* kComponent = "DockDaemon";

  std::unique_ptr<hyprdock::io::CommandRunner>
  checked(std::unique_ptr<hyprdock::io::CommandRunner> runner) {
    if (!runner)
      throw std::invalid_argument("[DockDaemon] command runner is nullptr");
    return runner;
  }
} // namespace

DockDaemon::DockDaemon(MonitorConfig config, std::unique_ptr<io::CommandRunner> runner,
                       std::shared_ptr<ErrorMonitor> errMonitor, Logger& log,
                       DockingController::Sleeper sleeper)
    : config_(std::move(config)), runner_(checked(std::move(runner))),
      errorMonitor_(std::move(errMonitor)), log_(log),
      probe_(config_, *runner_, errorMonitor_), actuator_(config_, *runner_, probe_, log_),
      controller_(actuator_, probe_, log_, config_.settleDelay, std::move(sleeper)) {}

DockDaemon::~DockDaemon() = default;

void DockDaemon::serve(const std::string& socketPath) {
  io::EventChannel channel;
  if (!channel.open(socketPath))
    fail("[DockDaemon] failed to connect to event socket: " + channel.lastError());
  log_.info(kComponent, "listening on " + socketPath);
  serve(channel);
}

void DockDaemon::serve(io::EventChannel& channel) {
  for (;;) {
    auto record = channel.readRecord();
    if (!record)
      fail("[DockDaemon] failed to read from event socket: " + channel.lastError());
    if (!protocols::isValidUtf8(*record))
      fail("[DockDaemon] event record is not valid UTF-8");

    controller_.handle(protocols::LidEvent::fromWire(*record));
  }
}

void DockDaemon::registerActions(ActionRegistry& registry) {
  registry.registerAction({ "--internal", "-i" }, "Switch to internal monitor only",
                          [this] { actuator_.enableInternalOnly(); });
  registry.registerAction({ "--external", "-e" }, "Switch to external monitor only",
                          [this] { actuator_.enableExternalOnly(); });
  registry.registerAction({ "--extend", "-eo" }, "Extends monitors",
                          [this] { actuator_.extend(); });
  registry.registerAction({ "--mirror", "-io" }, "Mirrors monitors",
                          [this] { actuator_.mirror(); });
  registry.registerAction({ "--suspend", "-su" }, "Lock the screen and suspend",
                          [this] { actuator_.lockAndSuspend(); });
  registry.registerAction({ "--server", "-s" },
                          "Daemon mode, handles laptop lid close and open",
                          [this] { serve(io::EventChannel::kAcpidSocket); });
}

void DockDaemon::fail(const std::string& message) {
  errorMonitor_->notifyFailure(message);
  throw std::runtime_error(message);
}
