#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer backing the daemon log file.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace hyprdock {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file in append mode, buffers writes, and
 *        flushes on demand or once the buffer passes 4 kB.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kFlushThreshold = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace hyprdock
