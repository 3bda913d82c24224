/* @file CliOptions.cpp
 * @brief argv → CliOptions
 *
 * © 2025 HyprDock - MIT-licensed.
 */

#include <stdexcept>

#include "core/CliOptions.hpp"

namespace hyprdock::core {

  CliOptions CliOptions::parse(const std::vector<std::string>& args) {
    CliOptions opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--config" || args[i] == "-c") {
        if (i + 1 >= args.size())
          throw std::invalid_argument("[CliOptions] " + args[i] + " needs a path");
        opts.configPath = args[++i];
      } else if (args[i] == "--verbose") {
        opts.verbose = true;
      } else {
        opts.actions.push_back(args[i]);
      }
    }
    return opts;
  }

} // namespace hyprdock::core
