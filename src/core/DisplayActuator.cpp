/* @file DisplayActuator.cpp
 * @brief layout command sequences
 *
 * © 2025 HyprDock - MIT-licensed.
 */

#include "core/DisplayActuator.hpp"
#include "core/Logger.hpp"
#include "core/MonitorConfig.hpp"
#include "core/MonitorProbe.hpp"
#include "io/CommandRunner.hpp"

using namespace hyprdock::core;

namespace {
  constexpr const char* kComponent = "DisplayActuator";
}

DisplayActuator::DisplayActuator(const MonitorConfig& config, io::CommandRunner& runner,
                                 const MonitorProbe& probe, Logger& log)
    : config_(config), runner_(runner), probe_(probe), log_(log) {}

void DisplayActuator::enableInternalOnly() {
  const bool needsRestart = !probe_.isInternalActive();
  log_.info(kComponent, needsRestart ? "internal only (panel was off)" : "internal only");
  switchToInternal();
  if (needsRestart) {
    restartBar();
    restartWallpaper();
  }
}

void DisplayActuator::enableExternalOnly() {
  if (!probe_.hasExternalMonitor()) {
    log_.info(kComponent, "external only requested but no external monitor present");
    return;
  }
  const bool needsRestart = probe_.isInternalActive();
  log_.info(kComponent, needsRestart ? "external only (panel was on)" : "external only");
  switchToExternal();
  if (needsRestart) {
    restartBar();
    restartWallpaper();
  }
}

void DisplayActuator::extend() {
  ensureInternalActive();
  applyExtend();
}

void DisplayActuator::mirror() {
  ensureInternalActive();
  applyMirror();
}

void DisplayActuator::restartWallpaper() { runner_.run(config_.wallpaperCommand); }

void DisplayActuator::restartBar() {
  // close first, otherwise a second bar instance is opened
  runner_.run(config_.closeBarCommand);
  runner_.run(config_.openBarCommand);
}

void DisplayActuator::fixBar() { runner_.run(config_.reloadBarCommand); }

void DisplayActuator::restartInternal() {
  runner_.run(config_.enableInternalMonitorCommand);
  restartWallpaper();
  restartBar();
  fixBar();
}

void DisplayActuator::switchToInternal() {
  runner_.run(config_.enableInternalMonitorCommand);
  runner_.run(config_.disableExternalMonitorCommand);
}

void DisplayActuator::switchToExternal() {
  runner_.run(config_.disableInternalMonitorCommand);
  runner_.run(config_.enableExternalMonitorCommand);
}

void DisplayActuator::applyExtend() {
  log_.info(kComponent, "extend");
  runner_.run(config_.extendCommand);
}

void DisplayActuator::applyMirror() {
  log_.info(kComponent, "mirror");
  runner_.run(config_.mirrorCommand);
}

void DisplayActuator::stopMedia() { runner_.run(config_.utilityCommand); }

void DisplayActuator::lockAndSuspend() {
  log_.info(kComponent, "lock and suspend");
  runner_.run(config_.lockCommand);
  runner_.run(config_.suspendCommand);
}

void DisplayActuator::ensureInternalActive() {
  if (!probe_.isInternalActive()) {
    log_.info(kComponent, "internal panel off, re-enabling before layout change");
    restartInternal();
  }
}
