#pragma once
/** @file  SocketAddress.hpp
 *  @brief IPv4 resolve / bind helpers shared by the TCP and UDP listeners.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <string>

// Linux header
#include <netinet/in.h>

namespace cuebridge::io {

  /// Resolve \p host ("127.0.0.1", "0.0.0.0", "localhost") to an IPv4 address.
  /// @throws std::runtime_error if it does not resolve.
  sockaddr_in resolveIpv4(const std::string& host, std::uint16_t port);

  /// socket() + SO_REUSEADDR + bind() (+ listen() for SOCK_STREAM).
  /// @returns the fd. @throws std::runtime_error with errno text on failure.
  int openBoundSocket(int type, const std::string& host, std::uint16_t port);

  /// Port actually bound (differs from the request when 0 was asked for).
  std::uint16_t boundPort(int fd);

  /// "a.b.c.d:port"
  std::string toString(const sockaddr_in& addr);

} // namespace cuebridge::io
