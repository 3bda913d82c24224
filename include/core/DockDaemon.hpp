#pragma once

/** @file  DockDaemon.hpp
 *  @brief Owns the runner/probe/actuator/controller wiring and the event loop.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <memory>
#include <string>

#include "core/DisplayActuator.hpp"
#include "core/DockingController.hpp"
#include "core/MonitorConfig.hpp"
#include "core/MonitorProbe.hpp"

namespace hyprdock {
  namespace io {
    class CommandRunner;
    class EventChannel;
  } // namespace io

  namespace core {

    class ActionRegistry;
    class ErrorMonitor;
    class Logger;

    class DockDaemon {

    public:
      DockDaemon(MonitorConfig config, std::unique_ptr<io::CommandRunner> runner,
                 std::shared_ptr<ErrorMonitor> errMonitor, Logger& log,
                 DockingController::Sleeper sleeper = {});
      ~DockDaemon();

      // ---- Public API -----------------------------------------------------
      /// Connect to \p socketPath and serve until a socket error; always throws.
      void serve(const std::string& socketPath);

      /// Serve records from an already open channel; throws once it fails or closes.
      void serve(io::EventChannel& channel);

      /// `--internal`, `--external`, `--extend`, `--mirror`, `--suspend`, `--server`.
      void registerActions(ActionRegistry& registry);

      const MonitorConfig& config() const { return config_; }
      const MonitorProbe& probe() const { return probe_; }
      DisplayActuator& actuator() { return actuator_; }
      DockingController& controller() { return controller_; }

      DockDaemon(const DockDaemon&) = delete;
      DockDaemon& operator=(const DockDaemon&) = delete;

    private:
      [[noreturn]] void fail(const std::string& message);

      // declaration order is construction order: probe/actuator hold references
      const MonitorConfig config_;
      std::unique_ptr<io::CommandRunner> runner_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      Logger& log_;
      MonitorProbe probe_;
      DisplayActuator actuator_;
      DockingController controller_;
    };

  } // namespace core
} // namespace hyprdock
