/* @file MonitorProbe.cpp
 * @brief monitor listing + substring classification
 *
 * © 2025 HyprDock - MIT-licensed.
 */

#include <stdexcept>

#include "core/ErrorMonitor.hpp"
#include "core/MonitorConfig.hpp"
#include "core/MonitorProbe.hpp"
#include "io/CommandRunner.hpp"
#include "protocols/Utf8.hpp"

using namespace hyprdock::core;

MonitorProbe::MonitorProbe(const MonitorConfig& config, io::CommandRunner& runner,
                           std::shared_ptr<ErrorMonitor> errMonitor)
    : config_(config), runner_(runner), errorMonitor_(std::move(errMonitor)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[MonitorProbe] error monitor is nullptr");
}

std::string MonitorProbe::listMonitors() const {
  std::string output = runner_.runCapture(config_.getMonitorsCommand);
  if (!protocols::isValidUtf8(output)) {
    std::string errMsg = "[MonitorProbe] output of '" + config_.getMonitorsCommand +
                         "' is not valid UTF-8";
    errorMonitor_->notifyFailure(errMsg);
    throw std::runtime_error(errMsg);
  }
  return output;
}

bool MonitorProbe::isInternalActive() const {
  return listMonitors().find(config_.monitorName) != std::string::npos;
}

bool MonitorProbe::hasExternalMonitor() const {
  return listMonitors().find(kSecondMonitorMarker) != std::string::npos;
}
