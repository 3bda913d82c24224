/* @file ProcessRunner.cpp
 * @brief spawns configured commands - fork/execvp, stdout capture over a pipe, exec error pipe
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring> // for strerror
#include <stdexcept>

// Linux headers
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

// HyprDock headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/ProcessRunner.hpp"
#include "protocols/CommandLine.hpp"

using namespace hyprdock::io;

namespace {
  constexpr const char* kComponent = "ProcessRunner";

  std::string joinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
      if (!out.empty())
        out += ' ';
      out += a;
    }
    return out;
  }

  void closeFd(int& fd) {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
} // namespace

ProcessRunner::ProcessRunner(std::shared_ptr<core::ErrorMonitor> errMonitor, core::Logger& log)
    : errorMonitor_(std::move(errMonitor)), log_(log) {
  if (!errorMonitor_)
    throw std::invalid_argument("[ProcessRunner] error monitor is nullptr");
}

ProcessRunner::~ProcessRunner() { reapFinished(); }

void ProcessRunner::run(const std::string& commandLine) {
  const auto argv = protocols::CommandLine{ commandLine }.argv();
  if (argv.empty())
    return;

  reapFinished();
  log_.debug(kComponent, "spawn: " + joinArgv(argv));
  detached_.push_back(spawn(argv, -1));
}

std::string ProcessRunner::runCapture(const std::string& commandLine) {
  const auto argv = protocols::CommandLine{ commandLine }.argv();
  if (argv.empty())
    return {};

  reapFinished();
  log_.debug(kComponent, "capture: " + joinArgv(argv));

  int out[2];
  if (::pipe2(out, O_CLOEXEC) != 0)
    fail("[ProcessRunner] pipe failed for '" + argv.front() + "': " + strerror(errno));

  pid_t pid = -1;
  try {
    pid = spawn(argv, out[1]);
  } catch (...) {
    closeFd(out[0]);
    closeFd(out[1]);
    throw;
  }
  closeFd(out[1]);

  std::string captured;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(out[0], buf, sizeof(buf));
    if (n > 0) {
      captured.append(buf, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break; // EOF, child closed stdout
    } else if (errno == EINTR) {
      continue;
    } else {
      const std::string err = strerror(errno);
      closeFd(out[0]);
      ::waitpid(pid, nullptr, 0);
      fail("[ProcessRunner] read from '" + argv.front() + "' failed: " + err);
    }
  }
  closeFd(out[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR)
      fail("[ProcessRunner] wait for '" + argv.front() + "' failed: " + strerror(errno));
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) != 0)
    log_.warning(kComponent, "'" + argv.front() + "' exited with status " +
                                 std::to_string(WEXITSTATUS(status)));
  else if (WIFSIGNALED(status))
    log_.warning(kComponent, "'" + argv.front() + "' killed by signal " +
                                 std::to_string(WTERMSIG(status)));

  return captured;
}

void ProcessRunner::reapFinished() {
  detached_.erase(std::remove_if(detached_.begin(), detached_.end(),
                                 [](pid_t pid) {
                                   int status = 0;
                                   pid_t rc = ::waitpid(pid, &status, WNOHANG);
                                   // rc == 0: still running; -1 (ECHILD): already gone
                                   return rc != 0;
                                 }),
                  detached_.end());
}

pid_t ProcessRunner::spawn(const std::vector<std::string>& argv, int stdoutFd) {
  // argv for execvp is built before fork, the child only calls async-signal-safe functions
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv)
    cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  int status[2];
  if (::pipe2(status, O_CLOEXEC) != 0)
    fail("[ProcessRunner] pipe failed for '" + argv.front() + "': " + strerror(errno));

  pid_t pid = ::fork();
  if (pid < 0) {
    const std::string err = strerror(errno);
    closeFd(status[0]);
    closeFd(status[1]);
    fail("[ProcessRunner] fork failed for '" + argv.front() + "': " + err);
  }

  if (pid == 0) {
    if (stdoutFd >= 0 && ::dup2(stdoutFd, STDOUT_FILENO) < 0) {
      int err = errno;
      (void)!::write(status[1], &err, sizeof(err));
      _exit(127);
    }
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    (void)!::write(status[1], &err, sizeof(err));
    _exit(127); // execvp failed
  }

  closeFd(status[1]);

  // EOF without data means exec succeeded and the pipe was closed by O_CLOEXEC
  int childErr = 0;
  ssize_t n;
  do {
    n = ::read(status[0], &childErr, sizeof(childErr));
  } while (n == -1 && errno == EINTR);
  closeFd(status[0]);

  if (n == static_cast<ssize_t>(sizeof(childErr))) {
    while (::waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
    }
    fail("[ProcessRunner] could not spawn '" + argv.front() + "': " + strerror(childErr) +
         " (check the configured command)");
  }
  return pid;
}

void ProcessRunner::fail(const std::string& message) {
  errorMonitor_->notifyFailure(message);
  throw std::runtime_error(message);
}
