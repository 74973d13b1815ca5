#pragma once
/** @file  UdpServer.hpp
 *  @brief Fire-and-forget datagram listener for reversible commands.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

// cuebridge headers
#include "core/CommandDispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"

namespace cuebridge {
  namespace io {

    /**
 * @class UdpServer
 * @brief One datagram == one JSON request. Never writes back.
 *
 *  * Malformed, oversized, unknown and TCP-only datagrams are logged and dropped.
 *  * Accepted commands are queued detached; their outcome is only logged.
 */
    class UdpServer {
    public:
      UdpServer(core::CommandDispatcher& dispatcher, std::shared_ptr<core::Logger> logger,
                std::shared_ptr<core::ErrorMonitor> errorMonitor, const core::ServerConfig& config);
      ~UdpServer(); ///< stop()

      //---public API------------------------------------------------------
      /// @throws std::runtime_error if the address cannot be bound.
      void bind();
      void start();
      void stop(); ///< idempotent

      /// Parse + dispatch one datagram payload. @returns true if queued.
      bool handleDatagram(std::string_view payload, const std::string& peer);

      std::uint16_t port() const noexcept { return port_; }
      std::uint64_t receivedCount() const noexcept { return received_.load(); }
      std::uint64_t droppedCount() const noexcept { return dropped_.load(); }

      UdpServer(const UdpServer&) = delete;
      UdpServer& operator=(const UdpServer&) = delete;

    private:
      void receiveLoop();

      core::CommandDispatcher& dispatcher_;
      std::shared_ptr<core::Logger> logger_;
      std::shared_ptr<core::ErrorMonitor> errorMonitor_;
      const core::ServerConfig& config_;

      int fd_{ -1 };
      std::uint16_t port_{ 0 };
      std::thread thread_;
      std::atomic<bool> running_{ false };

      std::atomic<std::uint64_t> received_{ 0 };
      std::atomic<std::uint64_t> dropped_{ 0 };
    };

  } // namespace io
} // namespace cuebridge
