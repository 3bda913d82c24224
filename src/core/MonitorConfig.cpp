/* @file MonitorConfig.cpp
 * @brief defaults + strict JSON mapping for the command set
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <array>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// HyprDock headers
#include "core/MonitorConfig.hpp"
#include "protocols/CommandLine.hpp"

namespace hyprdock::core {

  namespace {
    using Field = std::pair<const char*, std::string MonitorConfig::*>;

    constexpr std::array<Field, 15> kFields{ {
        { "monitor_name", &MonitorConfig::monitorName },
        { "open_bar_command", &MonitorConfig::openBarCommand },
        { "close_bar_command", &MonitorConfig::closeBarCommand },
        { "reload_bar_command", &MonitorConfig::reloadBarCommand },
        { "suspend_command", &MonitorConfig::suspendCommand },
        { "lock_command", &MonitorConfig::lockCommand },
        { "utility_command", &MonitorConfig::utilityCommand },
        { "get_monitors_command", &MonitorConfig::getMonitorsCommand },
        { "enable_internal_monitor_command", &MonitorConfig::enableInternalMonitorCommand },
        { "disable_internal_monitor_command", &MonitorConfig::disableInternalMonitorCommand },
        { "enable_external_monitor_command", &MonitorConfig::enableExternalMonitorCommand },
        { "disable_external_monitor_command", &MonitorConfig::disableExternalMonitorCommand },
        { "extend_command", &MonitorConfig::extendCommand },
        { "mirror_command", &MonitorConfig::mirrorCommand },
        { "wallpaper_command", &MonitorConfig::wallpaperCommand },
    } };

    constexpr const char* kSettleDelayKey = "settle_delay_ms";
    constexpr const char* kLogFileKey = "log_file";
  } // namespace

  MonitorConfig MonitorConfig::defaults() {
    MonitorConfig c;
    c.monitorName = "eDP-1";
    c.openBarCommand = "eww open bar";
    c.closeBarCommand = "eww close-all";
    c.reloadBarCommand = "eww reload";
    c.suspendCommand = "systemctl suspend";
    c.lockCommand = "swaylock -c 000000";
    c.utilityCommand = "playerctl --all-players -a pause";
    c.getMonitorsCommand = "hyprctl monitors";
    c.enableInternalMonitorCommand = "hyprctl keyword monitor eDP-1,highrr,0x0,1";
    c.disableInternalMonitorCommand = "hyprctl keyword monitor eDP-1,disabled";
    c.enableExternalMonitorCommand = "hyprctl keyword monitor ,highrr,0x0,1";
    c.disableExternalMonitorCommand = "hyprctl keyword monitor ,disabled";
    c.extendCommand = "hyprctl keyword monitor ,highrr,1920x0,1";
    c.mirrorCommand = "hyprctl keyword monitor ,highrr,0x0,1";
    c.wallpaperCommand = "hyprctl dispatch hyprpaper";
    return c;
  }

  MonitorConfig MonitorConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object())
      throw std::runtime_error("top level must be an object");

    MonitorConfig c;
    for (const auto& [key, member] : kFields) {
      auto it = j.find(key);
      if (it == j.end())
        throw std::runtime_error(std::string("missing key '") + key + "'");
      if (!it->is_string())
        throw std::runtime_error(std::string("'") + key + "' must be a string");
      std::string value = it->get<std::string>();
      if (protocols::CommandLine{ value }.empty())
        throw std::runtime_error(std::string("'") + key + "' must not be empty");
      c.*member = std::move(value);
    }

    if (auto it = j.find(kSettleDelayKey); it != j.end()) {
      if (!it->is_number_integer() || it->get<long long>() < 0)
        throw std::runtime_error(std::string("'") + kSettleDelayKey +
                                 "' must be a non-negative integer");
      c.settleDelay = std::chrono::milliseconds{ it->get<long long>() };
    }

    if (auto it = j.find(kLogFileKey); it != j.end()) {
      if (!it->is_string())
        throw std::runtime_error(std::string("'") + kLogFileKey + "' must be a string");
      c.logFile = it->get<std::string>();
    }
    return c;
  }

  nlohmann::json MonitorConfig::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, member] : kFields)
      j[key] = this->*member;
    j[kSettleDelayKey] = settleDelay.count();
    if (!logFile.empty())
      j[kLogFileKey] = logFile;
    return j;
  }

} // namespace hyprdock::core
