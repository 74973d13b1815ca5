#pragma once
/** @file  Transport.hpp
 *  @brief Inbound channel a command arrived on.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string_view>

namespace cuebridge {
  namespace protocols {

    enum class Transport : std::uint8_t { Tcp, Udp };

    inline std::string_view toString(Transport t) {
      switch (t) {
      case Transport::Tcp:
        return "TCP";
      case Transport::Udp:
        return "UDP";
      default:
        return "Unknown";
      }
    }

  } // namespace protocols
} // namespace cuebridge
