/* @file TcpServer.cpp
 * @brief accept loop and connection registry for the request/response transport
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <stdexcept>
#include <system_error>

// Linux headers
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// cuebridge headers
#include "io/SocketAddress.hpp"
#include "io/StreamSocket.hpp"
#include "io/TcpServer.hpp"

using namespace cuebridge::io;

namespace {
  constexpr std::string_view kComponent = "TcpServer";
}

TcpServer::TcpServer(core::CommandDispatcher& dispatcher, std::shared_ptr<core::Logger> logger,
                     std::shared_ptr<core::ErrorMonitor> errorMonitor,
                     const core::ServerConfig& config)
    : dispatcher_(dispatcher), logger_(std::move(logger)), errorMonitor_(std::move(errorMonitor)),
      config_(config) {
  if (!logger_ || !errorMonitor_)
    throw std::invalid_argument("[TcpServer] logger and error monitor are required");
}

TcpServer::~TcpServer() { stop(); }

void TcpServer::bind() {
  if (listenFd_ >= 0)
    return;
  try {
    listenFd_ = openBoundSocket(SOCK_STREAM, config_.host, config_.tcpPort);
    port_ = boundPort(listenFd_);
  } catch (const std::runtime_error& e) {
    if (listenFd_ >= 0)
      ::close(listenFd_);
    listenFd_ = -1;
    throw std::runtime_error(std::string("[TcpServer] ") + e.what());
  }
  logger_->info(kComponent, "listening on " + config_.host + ":" + std::to_string(port_));
}

void TcpServer::start() {
  if (listenFd_ < 0)
    throw std::logic_error("[TcpServer] start() before bind()");
  if (accepting_.exchange(true))
    return;
  connectionsRunning_.store(true);
  acceptThread_ = std::thread([this] { acceptLoop(); });
}

void TcpServer::stopAccepting() {
  accepting_.store(false);
  if (acceptThread_.joinable())
    acceptThread_.join();
  if (listenFd_ >= 0) {
    ::close(listenFd_);
    listenFd_ = -1;
    logger_->info(kComponent, "listener closed");
  }
}

void TcpServer::closeConnections(std::chrono::milliseconds linger) {
  connectionsRunning_.store(false);

  const auto deadline = std::chrono::steady_clock::now() + linger;
  while (activeConnections() > 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });

  std::list<Session> sessions;
  {
    std::lock_guard<std::mutex> lock(sessionsMtx_);
    sessions.swap(sessions_);
  }
  for (auto& s : sessions)
    s.connection->shutdown();
  for (auto& s : sessions) {
    if (s.thread.joinable())
      s.thread.join();
  }
}

void TcpServer::stop() {
  stopAccepting();
  closeConnections();
}

std::size_t TcpServer::activeConnections() const {
  std::lock_guard<std::mutex> lock(sessionsMtx_);
  std::size_t active = 0;
  for (const auto& s : sessions_) {
    if (!s.connection->finished())
      ++active;
  }
  return active;
}

// -------------------------------------------------------------------
// TcpServer::acceptLoop
// Polls the listener so the loop notices stopAccepting() within one
// poll interval; transient accept errors are logged and retried.
// -------------------------------------------------------------------
void TcpServer::acceptLoop() {
  while (accepting_.load()) {
    reapFinished();

    pollfd pfd{ listenFd_, POLLIN, 0 };
    int rc = ::poll(&pfd, 1, static_cast<int>(config_.pollInterval.count()));
    if (rc == 0)
      continue;
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      errorMonitor_->notifyFailure(std::string("TCP listener poll failed: ") +
                                   std::strerror(errno));
      return;
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    int clientFd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
    if (clientFd < 0) {
      const int err = errno;
      if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ECONNABORTED)
        continue;
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        logger_->warn(kComponent, std::string("accept: ") + std::strerror(err));
        std::this_thread::sleep_for(config_.pollInterval);
        continue;
      }
      errorMonitor_->notifyFailure(std::string("TCP accept failed: ") + std::strerror(err));
      return;
    }

    launch(clientFd, toString(addr));
  }
}

void TcpServer::launch(int clientFd, std::string peer) {
  auto connection = std::make_unique<TcpConnection>(std::make_unique<StreamSocket>(clientFd),
                                                    dispatcher_, logger_, std::move(peer),
                                                    config_.maxMessageBytes, config_.pollInterval);

  std::lock_guard<std::mutex> lock(sessionsMtx_);
  auto& session = sessions_.emplace_back(Session{ std::move(connection), std::thread{} });
  TcpConnection* raw = session.connection.get();
  try {
    session.thread = std::thread([this, raw] { raw->run(connectionsRunning_); });
  } catch (const std::system_error& e) {
    sessions_.pop_back(); // closes the client socket
    logger_->warn(kComponent, std::string("cannot start connection thread: ") + e.what());
  }
}

void TcpServer::reapFinished() {
  std::list<Session> done;
  {
    std::lock_guard<std::mutex> lock(sessionsMtx_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->connection->finished()) {
        auto next = std::next(it);
        done.splice(done.end(), sessions_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto& s : done) {
    if (s.thread.joinable())
      s.thread.join();
  }
}
