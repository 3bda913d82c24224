#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads the per-user command configuration (JSON).
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/MonitorConfig.hpp"

namespace hyprdock::core {

  /**
 * @class ConfigLoader
 * @brief Resolves the startup command set: the user's hyprdock.json when it
 *        exists, the built-in Hyprland/eww defaults when it does not.
 *
 *  * Read once by `main` before any action runs; MonitorConfig is immutable after.
 *  * Key checking lives in `MonitorConfig::fromJson()`; this class only adds
 *    the file path to whatever it reports.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// `$HOME/.config/hypr/hyprdock.json` (passwd entry if HOME is unset).
    static std::string defaultPath();

    /// Parse the file, std::nullopt if it does not exist, `std::runtime_error` if unreadable or invalid.
    std::optional<nlohmann::json> load() const;

    /// Built-in defaults when absent; `std::runtime_error("Unable to load data from ...")` when malformed.
    MonitorConfig loadConfig() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

} // namespace hyprdock::core
