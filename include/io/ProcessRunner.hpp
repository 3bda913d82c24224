#pragma once
/** @file  ProcessRunner.hpp
 *  @brief fork/exec based CommandRunner.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>
#include <vector>

// Linux headers
#include <sys/types.h>

// HyprDock headers
#include "io/CommandRunner.hpp"

namespace hyprdock {
  namespace core {
    class ErrorMonitor;
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class ProcessRunner
 * @brief Spawns commands with `execvp`, PATH lookup included.
 *
 *  * Exec failures are reported back over a close-on-exec pipe, so a missing
 *    binary is detected by the spawning call itself.
 *  * Detached children are reaped with WNOHANG on every later spawn; nothing
 *    ever blocks on them.
 */
    class ProcessRunner : public CommandRunner {
    public:
      ProcessRunner(std::shared_ptr<core::ErrorMonitor> errMonitor, core::Logger& log);
      ~ProcessRunner() override;

      void run(const std::string& commandLine) override;
      std::string runCapture(const std::string& commandLine) override;

      /// Detached children spawned but not yet reaped.
      std::size_t pendingChildren() const { return detached_.size(); }

      /// Non-blocking sweep over detached children.
      void reapFinished();

      ProcessRunner(const ProcessRunner&) = delete;
      ProcessRunner& operator=(const ProcessRunner&) = delete;

    private:
      pid_t spawn(const std::vector<std::string>& argv, int stdoutFd);
      [[noreturn]] void fail(const std::string& message);

      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      core::Logger& log_;
      std::vector<pid_t> detached_;
    };

  } // namespace io
} // namespace hyprdock
