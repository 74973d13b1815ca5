#pragma once
/** @file  ServerConfig.hpp
 *  @brief Typed, validated settings for listeners, serializer and logging.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace cuebridge::core {

  struct ServerConfig {
    static constexpr std::uint16_t kDefaultTcpPort = 9877;
    /// Upper bound for every duration setting; keeps deadline arithmetic
    /// on steady_clock and poll()'s int timeout far from overflow.
    static constexpr std::chrono::milliseconds kMaxDuration{ std::chrono::hours{ 1 } };

    std::string host{ "127.0.0.1" };
    std::uint16_t tcpPort{ kDefaultTcpPort };
    std::uint16_t udpPort{ kDefaultTcpPort + 1 }; ///< convention: tcp + 1
    std::chrono::milliseconds requestTimeout{ 10000 };
    std::chrono::milliseconds shutdownGrace{ 2000 };
    std::chrono::milliseconds pollInterval{ 200 };
    std::size_t maxMessageBytes{ 1024 * 1024 };
    std::size_t maxDatagramBytes{ 2048 };
    std::string logLevel{ "info" };
    std::string logFile{}; ///< empty = stderr
    std::chrono::milliseconds hostLatency{ 0 };

    /// Overlay \p doc on the defaults. Missing keys keep their default;
    /// a missing `udp_port` follows `tcp_port` + 1 (0 stays 0).
    /// @throws std::invalid_argument on wrong types or out-of-range values.
    static ServerConfig fromJson(const nlohmann::json& doc);

    /// @throws std::invalid_argument
    void validate() const;
  };

} // namespace cuebridge::core
