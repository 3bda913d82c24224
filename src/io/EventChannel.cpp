/* @file EventChannel.cpp
 * @brief AF_UNIX stream client for acpid - connect, blocking record reads, RAII close
 *
 * © 2025 HyprDock - MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <utility>

// Linux headers
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

// HyprDock headers
#include "io/EventChannel.hpp"

using namespace hyprdock::io;

EventChannel::~EventChannel() { close(); }

EventChannel::EventChannel(EventChannel&& other) noexcept
    : lastError_(std::move(other.lastError_)), fd_(std::exchange(other.fd_, -1)) {}

EventChannel& EventChannel::operator=(EventChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    lastError_ = std::move(other.lastError_);
  }
  return *this;
}

bool EventChannel::open(const std::string& socketPath) {
  close();

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  if (socketPath.empty() || socketPath.size() >= sizeof(addr.sun_path)) {
    lastError_ = "invalid socket path '" + socketPath + "'";
    return false;
  }
  std::memcpy(addr.sun_path, socketPath.c_str(), socketPath.size() + 1);

  fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ < 0) {
    lastError_ = std::string("socket: ") + strerror(errno);
    return false;
  }

  int rc;
  do {
    rc = ::connect(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  } while (rc == -1 && errno == EINTR);

  if (rc != 0) {
    lastError_ = "connect to " + socketPath + ": " + strerror(errno);
    close();
    return false;
  }
  return true;
}

void EventChannel::adopt(int fd) {
  close();
  fd_ = fd;
}

std::optional<std::string> EventChannel::readRecord() {
  if (fd_ < 0) {
    lastError_ = "socket not connected";
    return std::nullopt;
  }

  char buf[kRecordSize];
  for (;;) {
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n > 0)
      return std::string(buf, static_cast<std::size_t>(n));
    if (n == 0) { // EOF / acpid went away
      lastError_ = "event socket closed by peer";
      close();
      return std::nullopt;
    }
    if (errno == EINTR)
      continue; // interrupted → retry
    lastError_ = std::string("read: ") + strerror(errno);
    return std::nullopt;
  }
}

void EventChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
