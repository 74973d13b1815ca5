/* @file UdpServer.cpp
 * @brief datagram receive loop; parses and hands requests to the dispatcher, never replies
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <stdexcept>
#include <vector>

// Linux headers
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// cuebridge headers
#include "io/SocketAddress.hpp"
#include "io/UdpServer.hpp"
#include "protocols/ProtocolError.hpp"
#include "protocols/Request.hpp"

using namespace cuebridge::io;
using cuebridge::protocols::ProtocolError;
using cuebridge::protocols::Request;

namespace {
  constexpr std::string_view kComponent = "UdpServer";
}

UdpServer::UdpServer(core::CommandDispatcher& dispatcher, std::shared_ptr<core::Logger> logger,
                     std::shared_ptr<core::ErrorMonitor> errorMonitor,
                     const core::ServerConfig& config)
    : dispatcher_(dispatcher), logger_(std::move(logger)), errorMonitor_(std::move(errorMonitor)),
      config_(config) {
  if (!logger_ || !errorMonitor_)
    throw std::invalid_argument("[UdpServer] logger and error monitor are required");
}

UdpServer::~UdpServer() { stop(); }

void UdpServer::bind() {
  if (fd_ >= 0)
    return;
  try {
    fd_ = openBoundSocket(SOCK_DGRAM, config_.host, config_.udpPort);
    port_ = boundPort(fd_);
  } catch (const std::runtime_error& e) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = -1;
    throw std::runtime_error(std::string("[UdpServer] ") + e.what());
  }
  logger_->info(kComponent, "listening on " + config_.host + ":" + std::to_string(port_));
}

void UdpServer::start() {
  if (fd_ < 0)
    throw std::logic_error("[UdpServer] start() before bind()");
  if (running_.exchange(true))
    return;
  thread_ = std::thread([this] { receiveLoop(); });
}

void UdpServer::stop() {
  running_.store(false);
  if (thread_.joinable())
    thread_.join();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
    logger_->info(kComponent, "listener closed (" + std::to_string(received_.load()) +
                                  " datagrams, " + std::to_string(dropped_.load()) + " dropped)");
  }
}

bool UdpServer::handleDatagram(std::string_view payload, const std::string& peer) {
  try {
    auto request = Request::fromWire(payload);
    logger_->trace(kComponent, "received command: " + request.type + " from " + peer);
    if (dispatcher_.dispatchDetached(std::move(request)))
      return true;
  } catch (const ProtocolError& e) {
    logger_->warn(kComponent, "dropped datagram from " + peer + ": " + e.what());
  }
  ++dropped_;
  return false;
}

// -------------------------------------------------------------------
// UdpServer::receiveLoop
// MSG_TRUNC makes recvfrom report the real datagram size, so anything
// larger than max_datagram_bytes is detected and dropped whole.
// -------------------------------------------------------------------
void UdpServer::receiveLoop() {
  std::vector<char> buffer(config_.maxDatagramBytes + 1);

  while (running_.load()) {
    pollfd pfd{ fd_, POLLIN, 0 };
    int rc = ::poll(&pfd, 1, static_cast<int>(config_.pollInterval.count()));
    if (rc == 0)
      continue;
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      errorMonitor_->notifyFailure(std::string("UDP listener poll failed: ") +
                                   std::strerror(errno));
      return;
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), MSG_TRUNC,
                           reinterpret_cast<sockaddr*>(&addr), &len);
    if (n < 0) {
      const int err = errno;
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ECONNREFUSED)
        continue;
      errorMonitor_->notifyFailure(std::string("UDP receive failed: ") + std::strerror(err));
      return;
    }

    ++received_;
    const auto size = static_cast<std::size_t>(n);
    if (size > config_.maxDatagramBytes) {
      ++dropped_;
      logger_->warn(kComponent, "dropped oversized datagram from " + toString(addr) + " (" +
                                    std::to_string(size) + " bytes)");
      continue;
    }
    handleDatagram(std::string_view(buffer.data(), size), toString(addr));
  }
}
