#include "transport.hpp"

#include <cerrno>
#include <chrono>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace faceverify {

namespace {
using Clock = std::chrono::steady_clock;

bool timed_out(ssize_t n) {
  return n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
}
} // namespace

bool set_socket_timeouts(int fd, int timeout_ms) {
  struct timeval tv;
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

ReadStatus read_request(int fd, std::size_t max_bytes, int timeout_ms,
                        std::string &out) {
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  char buffer[8192];
  while (true) {
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n == 0)
      return ReadStatus::OK;
    if (timed_out(n))
      return ReadStatus::TIMEOUT;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return ReadStatus::FAILED;
    }
    out.append(buffer, static_cast<std::size_t>(n));
    if (out.size() > max_bytes)
      return ReadStatus::TOO_LARGE;
    // Slow senders are bounded too, not just silent ones
    if (Clock::now() > deadline)
      return ReadStatus::TIMEOUT;
  }
}

bool drain_input(int fd, std::size_t max_bytes, int timeout_ms) {
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  char buffer[8192];
  std::size_t discarded = 0;
  while (discarded <= max_bytes && Clock::now() <= deadline) {
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n == 0)
      return true;
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    discarded += static_cast<std::size_t>(n);
  }
  return false;
}

bool write_all(int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

} // namespace faceverify
