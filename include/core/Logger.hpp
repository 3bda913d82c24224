#pragma once
/** @file  Logger.hpp
 *  @brief Levelled CSV-style line logger (stderr + optional log file).
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <memory>
#include <string>

namespace hyprdock {
  namespace io {
    class FileLogger; // keeps <cstdio> out of every core header
  }

  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error, Fatal };

    const char* toString(LogLevel level);

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    /**
 * @class Logger
 * @brief Formats `timestamp,level,component,message` lines.
 *
 *  * Synchronous; the daemon is single-threaded.
 *  * Events below the threshold are dropped before formatting.
 *  * File output is flushed at Warning and above so a fatal exit keeps the tail.
 */
    class Logger {

    public:
      explicit Logger(LogLevel threshold = LogLevel::Info, bool console = true);
      ~Logger();

      // --- public API ---
      bool openFile(const std::string& path); ///< append to \p path as well as stderr
      void log(const LogEvent& event);
      void flush();

      void setThreshold(LogLevel level) { threshold_ = level; }
      LogLevel threshold() const { return threshold_; }
      void setConsole(bool enabled) { console_ = enabled; }

      void debug(const std::string& component, const std::string& message) {
        log({ LogLevel::Debug, component, message });
      }
      void info(const std::string& component, const std::string& message) {
        log({ LogLevel::Info, component, message });
      }
      void warning(const std::string& component, const std::string& message) {
        log({ LogLevel::Warning, component, message });
      }
      void error(const std::string& component, const std::string& message) {
        log({ LogLevel::Error, component, message });
      }
      void fatal(const std::string& component, const std::string& message) {
        log({ LogLevel::Fatal, component, message });
      }

      /// Render one event as a log line (no trailing newline).
      static std::string format(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      LogLevel threshold_{ LogLevel::Info };
      bool console_{ true };
      std::unique_ptr<io::FileLogger> file_;
    };

  } // namespace core
} // namespace hyprdock
