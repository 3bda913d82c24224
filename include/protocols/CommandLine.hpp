#pragma once
/** @file  CommandLine.hpp
 *  @brief Configured command string split into argv tokens.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <sstream>
#include <string>
#include <vector>

namespace hyprdock {
  namespace protocols {

    /**
 * @struct CommandLine
 * @brief One configured command, e.g. `hyprctl keyword monitor ,disabled`.
 *
 *  * Tokens are whitespace-delimited; there is no quoting or escaping.
 *  * An all-whitespace line has no argv and is never spawned.
 */
    struct CommandLine {
      std::string text;

      std::vector<std::string> argv() const {
        std::vector<std::string> tokens;
        std::istringstream in(text);
        std::string tok;
        while (in >> tok)
          tokens.push_back(tok);
        return tokens;
      }

      bool empty() const { return argv().empty(); }
    };

  } // namespace protocols
} // namespace hyprdock
