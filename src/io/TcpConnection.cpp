/* @file TcpConnection.cpp
 * @brief per-client loop: socket → framer → dispatcher → socket
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// cuebridge headers
#include "io/TcpConnection.hpp"
#include "protocols/ProtocolError.hpp"
#include "protocols/Request.hpp"

using namespace cuebridge::io;
using cuebridge::protocols::ErrorKind;
using cuebridge::protocols::Frame;
using cuebridge::protocols::ProtocolError;
using cuebridge::protocols::Request;
using cuebridge::protocols::Response;

namespace {
  constexpr std::string_view kComponent = "TcpConnection";
}

TcpConnection::TcpConnection(std::unique_ptr<StreamSocket> socket,
                             core::CommandDispatcher& dispatcher,
                             std::shared_ptr<core::Logger> logger, std::string peer,
                             std::size_t maxMessageBytes, std::chrono::milliseconds pollInterval)
    : socket_(std::move(socket)), dispatcher_(dispatcher), logger_(std::move(logger)),
      peer_(std::move(peer)), framer_(maxMessageBytes), pollInterval_(pollInterval) {
  if (!socket_)
    throw std::invalid_argument("[TcpConnection] socket must not be null");
}

void TcpConnection::run(const std::atomic<bool>& keepRunning) {
  logger_->info(kComponent, "client connected: " + peer_);
  serve(keepRunning);
  socket_->close();
  finished_.store(true);
  logger_->info(kComponent, "client disconnected: " + peer_ + " (" +
                                std::to_string(handled_.load()) + " requests)");
}

void TcpConnection::shutdown() { socket_->shutdown(); }

void TcpConnection::serve(const std::atomic<bool>& keepRunning) {
  while (keepRunning.load()) {
    auto chunk = socket_->read(pollInterval_);
    switch (chunk.status) {
      case StreamSocket::ReadStatus::Timeout:
        continue;
      case StreamSocket::ReadStatus::Closed:
        return;
      case StreamSocket::ReadStatus::Error:
        logger_->warn(kComponent, "read failed on " + peer_);
        return;
      case StreamSocket::ReadStatus::Data:
        framer_.feed(chunk.bytes);
        break;
    }

    while (auto frame = framer_.next()) {
      const auto response = handleFrame(*frame);
      ++handled_;
      if (!socket_->writeAll(response.toWire())) {
        logger_->warn(kComponent, "write failed on " + peer_ + ", dropping connection");
        return;
      }
    }
  }
}

Response TcpConnection::handleFrame(const Frame& frame) {
  if (!frame.valid()) {
    logger_->warn(kComponent, peer_ + ": " + frame.text);
    return Response::failure(ErrorKind::ParseError, frame.text);
  }

  try {
    auto request = Request::fromWire(frame.text);
    logger_->debug(kComponent, "received command: " + request.type);
    return dispatcher_.dispatchAndWait(std::move(request));
  } catch (const ProtocolError& e) {
    logger_->warn(kComponent, peer_ + ": " + e.what());
    return Response::failure(e.kind(), e.what());
  }
}
