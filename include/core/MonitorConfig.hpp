#pragma once
/** @file  MonitorConfig.hpp
 *  @brief Immutable command set the daemon runs against.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <chrono>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace hyprdock::core {

  /**
 * @struct MonitorConfig
 * @brief Internal monitor name plus every command template, loaded once at
 *        startup and read-only afterwards.
 *
 *  * Every command is a whitespace-split command line without quoting.
 *  * JSON keys match the snake_case names in `fromJson()`.
 */
  struct MonitorConfig {
    std::string monitorName;
    std::string openBarCommand;
    std::string closeBarCommand;
    std::string reloadBarCommand;
    std::string suspendCommand;
    std::string lockCommand;
    std::string utilityCommand;
    std::string getMonitorsCommand;
    std::string enableInternalMonitorCommand;
    std::string disableInternalMonitorCommand;
    std::string enableExternalMonitorCommand;
    std::string disableExternalMonitorCommand;
    std::string extendCommand;
    std::string mirrorCommand;
    std::string wallpaperCommand;

    /// Wait between the external-only switch and the bar/wallpaper restart on lid close.
    std::chrono::milliseconds settleDelay{ 1000 };

    /// Optional log file; empty logs to stderr only.
    std::string logFile;

    /// Built-in Hyprland/eww/hyprpaper command set used when no file exists.
    static MonitorConfig defaults();

    /// Throws `std::runtime_error` naming the offending key.
    static MonitorConfig fromJson(const nlohmann::json& j);

    /// Inverse of `fromJson()`, used by `--print-config`.
    nlohmann::json toJson() const;
  };

} // namespace hyprdock::core
