/* @file DockingController.cpp
 * @brief lid close/open handling
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <string>
#include <thread>

// HyprDock headers
#include "core/DisplayActuator.hpp"
#include "core/DockingController.hpp"
#include "core/Logger.hpp"
#include "core/MonitorProbe.hpp"
#include "protocols/LidEvent.hpp"

using namespace hyprdock::core;
using hyprdock::protocols::LidEvent;

namespace {
  constexpr const char* kComponent = "DockingController";
}

DockingController::DockingController(DisplayActuator& actuator, const MonitorProbe& probe,
                                     Logger& log, std::chrono::milliseconds settleDelay,
                                     Sleeper sleeper)
    : actuator_(actuator), probe_(probe), log_(log), settleDelay_(settleDelay),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_)
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

void DockingController::handle(const LidEvent& event) {
  switch (event.kind) {
  case LidEvent::Kind::Close:
    log_.info(kComponent, "lid closed");
    handleClose();
    break;
  case LidEvent::Kind::Open:
    log_.info(kComponent, "lid opened");
    handleOpen();
    break;
  default:
    log_.debug(kComponent, "ignoring event: " + event.text);
    break;
  }
}

void DockingController::handleClose() {
  if (probe_.hasExternalMonitor()) {
    log_.info(kComponent, "docked, switching to external monitor");
    actuator_.switchToExternal();
    sleeper_(settleDelay_); // backend must finish the mode switch before bar/wallpaper restart
    actuator_.restartWallpaper();
    actuator_.restartBar();
  } else {
    log_.info(kComponent, "undocked, suspending");
    actuator_.stopMedia();
    actuator_.lockAndSuspend();
  }
}

void DockingController::handleOpen() {
  if (probe_.isInternalActive()) {
    log_.debug(kComponent, "internal monitor already active");
    return;
  }

  if (!probe_.hasExternalMonitor()) {
    log_.info(kComponent, "no external monitor, switching to internal");
    actuator_.switchToInternal();
  } else {
    log_.info(kComponent, "external monitor present, extending");
    // panel was seen off above; enable it unconditionally rather than probing again
    actuator_.restartInternal();
    actuator_.applyExtend();
  }
  actuator_.restartWallpaper();
  actuator_.restartBar();
  actuator_.fixBar();
}
