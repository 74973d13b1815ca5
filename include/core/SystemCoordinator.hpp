#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Lifecycle FSM: brings the bridge up, keeps it up, takes it down.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

// cuebridge headers
#include "core/CommandClassifier.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExecutionSerializer.hpp"
#include "core/HostApi.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "io/TcpServer.hpp"
#include "io/UdpServer.hpp"

namespace cuebridge {
  namespace core {

    /**
 * @class SystemCoordinator
 * @brief Owns every runtime component and sequences start-up / shutdown.
 *
 *  Boot -> Init (sockets bound, serializer running) -> Running (listeners
 *  accepting) -> Draining -> Stopped. A bind failure or an escalated fault
 *  lands in Error.
 *
 *  Shutdown order: stop accepting, let queued work finish within
 *  `shutdown_grace`, release blocked TCP waiters, close connections,
 *  stop the serializer. Calling shutdown() again is a no-op.
 */
    class SystemCoordinator {

    public:
      enum class State { Boot, Init, Running, Draining, Stopped, Error };

      SystemCoordinator(ServerConfig config, std::unique_ptr<HostApi> host,
                        std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errorMonitor);
      ~SystemCoordinator(); ///< shutdown()

      //---public API------------------------------------------------------
      /// Bind both listeners and start the serializer.
      /// @throws std::runtime_error on bind failure (state becomes Error).
      void initialize();

      void start(); ///< begin accepting on both transports

      /// Ask the owner of the main loop to shut down. Safe from any thread.
      void requestShutdown();

      /// Blocks up to \p timeout. @returns true once a shutdown was requested.
      bool waitForShutdownRequest(std::chrono::milliseconds timeout);

      void shutdown();

      State state() const noexcept { return state_.load(); }
      bool healthy() const noexcept { return !faulted_.load(); }
      std::uint16_t tcpPort() const noexcept { return tcp_.port(); }
      std::uint16_t udpPort() const noexcept { return udp_.port(); }
      const ExecutionSerializer& serializer() const noexcept { return serializer_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void onFatal(const std::string& reason);

      ServerConfig config_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;

      CommandClassifier classifier_;
      ExecutionSerializer serializer_;
      CommandDispatcher dispatcher_;
      io::TcpServer tcp_;
      io::UdpServer udp_;

      std::atomic<State> state_{ State::Boot };
      std::atomic<bool> faulted_{ false };

      std::mutex requestMtx_;
      std::condition_variable requestCv_;
      bool shutdownRequested_{ false };

      std::mutex shutdownMtx_; ///< serializes shutdown() callers
      bool shutdownDone_{ false };
    };

    std::string_view toString(SystemCoordinator::State state);

  } // namespace core
} // namespace cuebridge
