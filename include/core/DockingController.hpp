#pragma once
/** @file  DockingController.hpp
 *  @brief Lid event state machine.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <chrono>
#include <functional>

namespace hyprdock {
  namespace protocols {
    struct LidEvent;
  }

  namespace core {

    class DisplayActuator;
    class Logger;
    class MonitorProbe;

    /**
 * @class DockingController
 * @brief Maps (lid event, live probe results) to a command sequence.
 *
 *  * Holds no docking state; each handler probes right before it branches.
 *  * Runs synchronously on the caller's thread. The settle delay on a docked
 *    lid close is the only deliberate wait.
 */
    class DockingController {
    public:
      using Sleeper = std::function<void(std::chrono::milliseconds)>;

      static constexpr std::chrono::milliseconds kDefaultSettleDelay{ 1000 };

      /// An empty \p sleeper falls back to `std::this_thread::sleep_for`.
      DockingController(DisplayActuator& actuator, const MonitorProbe& probe, Logger& log,
                        std::chrono::milliseconds settleDelay = kDefaultSettleDelay,
                        Sleeper sleeper = {});

      /// Dispatch one decoded record; Unrecognized events are ignored.
      void handle(const protocols::LidEvent& event);

      /**
       * @brief Lid closed.
       *
       * Docked: external only, settle, then wallpaper and bar restart.
       * Undocked: pause media, lock and suspend.
       */
      void handleClose();

      /**
       * @brief Lid opened.
       *
       * No-op while the internal panel is already active. Otherwise either
       * internal only or internal+extend, followed by a full bar refresh.
       */
      void handleOpen();

    private:
      DisplayActuator& actuator_;
      const MonitorProbe& probe_;
      Logger& log_;
      std::chrono::milliseconds settleDelay_;
      Sleeper sleeper_;
    };

  } // namespace core
} // namespace hyprdock
