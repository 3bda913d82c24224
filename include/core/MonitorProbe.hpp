#pragma once
/** @file  MonitorProbe.hpp
 *  @brief Live monitor topology queries.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <memory>
#include <string>
#include <string_view>

namespace hyprdock {
  namespace io {
    class CommandRunner;
  }

  namespace core {

    class ErrorMonitor;
    struct MonitorConfig;

    /**
 * @class MonitorProbe
 * @brief Runs `get_monitors_command` and classifies its output.
 *
 *  * Never caches; every query runs the listing command again.
 *  * Plain substring matching. A connector name that is a prefix of another
 *    (eDP-1 vs eDP-10) or appears elsewhere in the listing counts as a match.
 */
    class MonitorProbe {
    public:
      /// Marker the listing tool prints for the second enumerated display.
      static constexpr std::string_view kSecondMonitorMarker = "ID 1";

      MonitorProbe(const MonitorConfig& config, io::CommandRunner& runner,
                   std::shared_ptr<ErrorMonitor> errMonitor);

      bool isInternalActive() const;
      bool hasExternalMonitor() const;

      /// Raw listing, validated as UTF-8; throws `std::runtime_error` otherwise.
      std::string listMonitors() const;

    private:
      const MonitorConfig& config_;
      io::CommandRunner& runner_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
    };

  } // namespace core
} // namespace hyprdock
