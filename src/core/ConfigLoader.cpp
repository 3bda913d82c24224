/* @file ConfigLoader.cpp
 * @brief reads ~/.config/hypr/hyprdock.json, falls back to built-in defaults
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

// Linux headers
#include <pwd.h>
#include <unistd.h>

// 3rd-party headers
#include <nlohmann/json.hpp>

// HyprDock headers
#include "core/ConfigLoader.hpp"

namespace hyprdock::core {

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  std::string ConfigLoader::defaultPath() {
    std::string home;
    if (const char* env = std::getenv("HOME"); env && *env) {
      home = env;
    } else if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
      home = pw->pw_dir;
    } else {
      throw std::runtime_error("[ConfigLoader] cannot determine home directory");
    }
    return (std::filesystem::path(home) / ".config" / "hypr" / "hyprdock.json").string();
  }

  std::optional<nlohmann::json> ConfigLoader::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec))
      return std::nullopt;

    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("cannot open file");

    try {
      return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error(e.what());
    }
  }

  MonitorConfig ConfigLoader::loadConfig() const {
    try {
      auto parsed = load();
      if (!parsed)
        return MonitorConfig::defaults();
      return MonitorConfig::fromJson(*parsed);
    } catch (const std::exception& e) {
      throw std::runtime_error("Unable to load data from '" + path_ + "': " + e.what());
    }
  }

} // namespace hyprdock::core
