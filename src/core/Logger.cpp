/* @file Logger.cpp
 * @brief line logger - stderr plus io::FileLogger sink
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

// HyprDock headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

namespace hyprdock {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARNING";
      case LogLevel::Error:
        return "ERROR";
      case LogLevel::Fatal:
        return "FATAL";
      default:
        return "UNKNOWN";
      }
    }

    Logger::Logger(LogLevel threshold, bool console) : threshold_(threshold), console_(console) {}

    Logger::~Logger() { flush(); }

    bool Logger::openFile(const std::string& path) {
      auto file = std::make_unique<io::FileLogger>();
      if (!file->open(path))
        return false;
      file_ = std::move(file);
      return true;
    }

    std::string Logger::format(const LogEvent& event) {
      using namespace std::chrono;
      const auto now = system_clock::now();
      const std::time_t secs = system_clock::to_time_t(now);
      const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

      std::tm tm{};
      localtime_r(&secs, &tm);
      char stamp[32];
      std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);
      char frac[8];
      std::snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(millis));

      return std::string(stamp) + frac + ',' + toString(event.level) + ',' + event.component +
             ',' + event.message;
    }

    void Logger::log(const LogEvent& event) {
      if (event.level < threshold_)
        return;

      const std::string line = format(event);
      if (console_)
        std::cerr << line << '\n';
      if (file_) {
        file_->write(line + '\n');
        if (event.level >= LogLevel::Warning)
          file_->flush();
      }
    }

    void Logger::flush() {
      if (file_)
        file_->flush();
      if (console_)
        std::cerr.flush();
    }

  } // namespace core
} // namespace hyprdock
