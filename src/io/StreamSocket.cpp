/* @file StreamSocket.cpp
 * @brief IO abstraction layer that wraps an accepted TCP socket - handles fd, bounded reads, full writes and RAII - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// cuebridge headers
#include "io/StreamSocket.hpp"

using namespace cuebridge::io;

StreamSocket::~StreamSocket() { close(); }

StreamSocket::StreamSocket(StreamSocket&& other) noexcept : fd_(other.fd_.exchange(-1)) {}

StreamSocket& StreamSocket::operator=(StreamSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_.store(other.fd_.exchange(-1));
  }
  return *this;
}

// -------------------------------------------------------------------
// StreamSocket::read
// Waits up to `timeout` for readable data, then returns one chunk.
// Timeout lets the caller re-check its stop flag.
// -------------------------------------------------------------------
StreamSocket::ReadResult StreamSocket::read(std::chrono::milliseconds timeout) {
  const int fd = fd_.load();
  if (fd < 0)
    return { ReadStatus::Closed };

  pollfd pfd{ fd, POLLIN, 0 };
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc == -1) {
    if (errno == EINTR)
      return { ReadStatus::Timeout }; // interrupted → caller retries
    return { ReadStatus::Error };
  }
  if (rc == 0)
    return { ReadStatus::Timeout };

  char temp[kReadChunk];
  for (;;) {
    ssize_t n = ::recv(fd, temp, sizeof(temp), 0);
    if (n > 0)
      return { ReadStatus::Data, std::string(temp, static_cast<std::size_t>(n)) };
    if (n == 0)
      return { ReadStatus::Closed }; // orderly shutdown by the peer
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return { ReadStatus::Timeout };
    return { ReadStatus::Error };
  }
}

bool StreamSocket::writeAll(std::string_view data) {
  const int fd = fd_.load();
  if (fd < 0)
    return false;

  std::size_t total = 0;
  while (total < data.size()) {
    ssize_t written = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd, POLLOUT, 0 };
      if (::poll(&pfd, 1, kWriteStallMs) <= 0)
        return false;
    } else {
      return false;
    }
  }
  return true;
}

void StreamSocket::shutdown() {
  std::lock_guard<std::mutex> lock(releaseMtx_);
  const int fd = fd_.load();
  if (fd >= 0)
    ::shutdown(fd, SHUT_RDWR);
}

// read() and writeAll() run on the owning thread, which is also the only
// caller of close(); shutdown() is the one cross-thread entry point.
void StreamSocket::close() {
  std::lock_guard<std::mutex> lock(releaseMtx_);
  const int fd = fd_.exchange(-1);
  if (fd >= 0)
    ::close(fd);
}
