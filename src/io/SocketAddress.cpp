/* @file SocketAddress.cpp
 * @brief getaddrinfo / bind plumbing for the listeners
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <stdexcept>

// Linux headers
#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

// cuebridge headers
#include "io/SocketAddress.hpp"

namespace cuebridge::io {

  namespace {
    constexpr int kListenBacklog = 16;
  }

  sockaddr_in resolveIpv4(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr)
      throw std::runtime_error("cannot resolve host '" + host + "': " + ::gai_strerror(rc));

    sockaddr_in addr{};
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    ::freeaddrinfo(res);
    addr.sin_port = htons(port);
    return addr;
  }

  int openBoundSocket(int type, const std::string& host, std::uint16_t port) {
    const auto addr = resolveIpv4(host, port);

    int fd = ::socket(AF_INET, type | SOCK_CLOEXEC, 0);
    if (fd < 0)
      throw std::runtime_error(std::string("socket: ") + std::strerror(errno));

    int yes = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0) {
      const int err = errno;
      ::close(fd);
      throw std::runtime_error(std::string("setsockopt(SO_REUSEADDR): ") + std::strerror(err));
    }

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
      const int err = errno;
      ::close(fd);
      throw std::runtime_error("bind " + toString(addr) + ": " + std::strerror(err));
    }

    if (type == SOCK_STREAM && ::listen(fd, kListenBacklog) != 0) {
      const int err = errno;
      ::close(fd);
      throw std::runtime_error("listen " + toString(addr) + ": " + std::strerror(err));
    }
    return fd;
  }

  std::uint16_t boundPort(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
      throw std::runtime_error(std::string("getsockname: ") + std::strerror(errno));
    return ntohs(addr.sin_port);
  }

  std::string toString(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = { 0 };
    if (::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)) == nullptr)
      return "?:" + std::to_string(ntohs(addr.sin_port));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
  }

} // namespace cuebridge::io
