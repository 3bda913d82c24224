#pragma once
/** @file  EventChannel.hpp
 *  @brief Blocking client for the acpid event socket.
 *
 *  © 2025 HyprDock - MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>

namespace hyprdock {
  namespace io {

    /**
 * @class EventChannel
 * @brief RAII wrapper around one connected AF_UNIX stream socket.
 *
 *  * Each `readRecord()` is one blocking read of up to kRecordSize bytes and
 *    the bytes read are returned as one record; there is no reassembly.
 *  * *Non-copyable*, but move-constructible.
 */
    class EventChannel {

    public:
      static constexpr const char* kAcpidSocket = "/var/run/acpid.socket";
      static constexpr std::size_t kRecordSize = 1024;

      //---ctr / dtr--------------------------------------------
      EventChannel() = default;
      virtual ~EventChannel(); // closes the socket

      //---public API-------------------------------------------
      bool open(const std::string& socketPath);         // false if connect fails
      virtual std::optional<std::string> readRecord();  // nullopt on EOF or error
      void close();

      /// Adopt an already connected stream fd (socketpair, inherited fd).
      void adopt(int fd);

      bool isOpen() const { return fd_ >= 0; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------
      EventChannel(const EventChannel&) = delete;
      EventChannel& operator=(const EventChannel&) = delete;

      //---mv and mv assign-------------------------------------
      EventChannel(EventChannel&& other) noexcept;
      EventChannel& operator=(EventChannel&& other) noexcept;

    protected:
      std::string lastError_{}; ///< reason for the last false/nullopt

    private:
      int fd_{ -1 }; ///< POSIX fd (-1==closed)
    };
  } // namespace io
} // namespace hyprdock
