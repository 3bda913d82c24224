#pragma once
/** @file  CommandRunner.hpp
 *  @brief Abstract seam for spawning configured commands.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <string>

namespace hyprdock {
  namespace io {

    /**
 * @class CommandRunner
 * @brief Runs one whitespace-split command line.
 *
 *  * `run()` is fire-and-forget; `runCapture()` blocks until exit and returns stdout.
 *  * An empty or all-whitespace line spawns nothing.
 *  * Implementations throw `std::runtime_error` when a process cannot be spawned.
 */
    class CommandRunner {
    public:
      virtual ~CommandRunner() = default;

      virtual void run(const std::string& commandLine) = 0;
      virtual std::string runCapture(const std::string& commandLine) = 0;
    };

  } // namespace io
} // namespace hyprdock
