#pragma once
/** @file  TcpServer.hpp
 *  @brief Listener + accept loop; one handler thread per client.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

// cuebridge headers
#include "core/CommandDispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "io/TcpConnection.hpp"

namespace cuebridge {
  namespace io {

    /**
 * @class TcpServer
 * @brief Owns the listening socket and the connection registry.
 *
 *  * bind() happens up front so a busy port fails startup, not a thread.
 *  * Finished connections are reaped on every accept-loop tick.
 *  * Shutdown is two-phase: stopAccepting() first, closeConnections()
 *    once in-flight work had its chance to finish.
 */
    class TcpServer {
    public:
      TcpServer(core::CommandDispatcher& dispatcher, std::shared_ptr<core::Logger> logger,
                std::shared_ptr<core::ErrorMonitor> errorMonitor, const core::ServerConfig& config);
      ~TcpServer(); ///< stop()

      //---public API------------------------------------------------------
      /// @throws std::runtime_error if the address cannot be bound.
      void bind();
      void start();

      void stopAccepting();

      /// Ask every connection to finish, wait up to \p linger for them to
      /// write their last response, then force the rest closed and join.
      void closeConnections(std::chrono::milliseconds linger = std::chrono::milliseconds{ 0 });
      void stop(); ///< both of the above; idempotent

      std::uint16_t port() const noexcept { return port_; }
      std::size_t activeConnections() const;

      TcpServer(const TcpServer&) = delete;
      TcpServer& operator=(const TcpServer&) = delete;

    private:
      struct Session {
        std::unique_ptr<TcpConnection> connection;
        std::thread thread;
      };

      void acceptLoop();
      void launch(int clientFd, std::string peer);
      void reapFinished();

      core::CommandDispatcher& dispatcher_;
      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      const core::ServerConfig& config_;

      int listenFd_{ -1 };
      std::uint16_t port_{ 0 };
      std::thread acceptThread_;
      std::atomic<bool> accepting_{ false };
      std::atomic<bool> connectionsRunning_{ true };

      mutable std::mutex sessionsMtx_;
      std::list<Session> sessions_;
    };

  } // namespace io
} // namespace cuebridge
