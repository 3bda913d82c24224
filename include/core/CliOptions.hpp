#pragma once
/** @file  CliOptions.hpp
 *  @brief Splits argv into global options and the ordered action list.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

namespace hyprdock::core {

  struct CliOptions {
    std::optional<std::string> configPath; ///< `--config/-c <path>`
    bool verbose{ false };                 ///< `--verbose`
    std::vector<std::string> actions;      ///< everything else, in order

    /// A bare invocation only prints usage and must not touch the config file.
    bool needsConfig() const { return !actions.empty(); }

    /// Throws `std::invalid_argument` if `--config` has no path.
    static CliOptions parse(const std::vector<std::string>& args);
  };

} // namespace hyprdock::core
