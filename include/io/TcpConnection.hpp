#pragma once
/** @file  TcpConnection.hpp
 *  @brief One client stream: frame, dispatch, answer; strictly in order.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// cuebridge headers
#include "core/CommandDispatcher.hpp"
#include "core/Logger.hpp"
#include "io/StreamSocket.hpp"
#include "protocols/JsonStreamFramer.hpp"
#include "protocols/Response.hpp"

namespace cuebridge {
  namespace io {

    /**
 * @class TcpConnection
 * @brief Request/response loop for a single accepted socket.
 *
 *  * Exactly one Response is written per complete frame, in arrival order.
 *  * Malformed frames get a `parse_error` envelope; the connection stays up.
 *  * The loop ends on peer close, a read/write failure, or when the
 *    `keepRunning` flag passed to run() drops.
 */
    class TcpConnection {
    public:
      TcpConnection(std::unique_ptr<StreamSocket> socket, core::CommandDispatcher& dispatcher,
                    std::shared_ptr<core::Logger> logger, std::string peer,
                    std::size_t maxMessageBytes, std::chrono::milliseconds pollInterval);

      //---public API------------------------------------------------------
      /// Blocking; returns once the connection is finished.
      void run(const std::atomic<bool>& keepRunning);

      /// Unblock run() from another thread.
      void shutdown();

      bool finished() const noexcept { return finished_.load(); }
      std::uint64_t requestsHandled() const noexcept { return handled_.load(); }
      const std::string& peer() const noexcept { return peer_; }

    private:
      void serve(const std::atomic<bool>& keepRunning);
      protocols::Response handleFrame(const protocols::Frame& frame);

      std::unique_ptr<StreamSocket> socket_;
      core::CommandDispatcher& dispatcher_;
      std::shared_ptr<core::Logger> logger_;
      std::string peer_;
      protocols::JsonStreamFramer framer_;
      std::chrono::milliseconds pollInterval_;

      std::atomic<bool> finished_{ false };
      std::atomic<std::uint64_t> handled_{ 0 };
    };

  } // namespace io
} // namespace cuebridge
