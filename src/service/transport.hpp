#pragma once

#include <cstddef>
#include <string>

namespace faceverify {

enum class ReadStatus { OK, TOO_LARGE, TIMEOUT, FAILED };

// Applies timeout_ms to both SO_RCVTIMEO and SO_SNDTIMEO.
[[nodiscard]] bool set_socket_timeouts(int fd, int timeout_ms);

// Reads until the client half-closes. Gives up with TIMEOUT once a read
// stalls or timeout_ms has passed in total, and with TOO_LARGE once more
// than max_bytes arrived.
ReadStatus read_request(int fd, std::size_t max_bytes, int timeout_ms,
                        std::string &out);

// Discards input until EOF so close() does not reset the connection before
// the client reads our reply. Stops after max_bytes or timeout_ms. Returns
// true if EOF was reached.
bool drain_input(int fd, std::size_t max_bytes, int timeout_ms);

// Returns false if the peer went away before everything was sent.
bool write_all(int fd, const std::string &data);

} // namespace faceverify
