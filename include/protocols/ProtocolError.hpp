#pragma once
/** @file  ProtocolError.hpp
 *  @brief Error taxonomy shared by the wire codec, dispatcher and serializer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cuebridge {
  namespace protocols {

    enum class ErrorKind : std::uint8_t {
      ParseError,
      UnknownCommand,
      TransportNotAllowed,
      HostError,
      TimeoutError,
      Shutdown
    };

    /// Wire spelling used in the `error_kind` field.
    inline std::string_view toString(ErrorKind kind) {
      switch (kind) {
      case ErrorKind::ParseError:
        return "parse_error";
      case ErrorKind::UnknownCommand:
        return "unknown_command";
      case ErrorKind::TransportNotAllowed:
        return "transport_not_allowed";
      case ErrorKind::HostError:
        return "host_error";
      case ErrorKind::TimeoutError:
        return "timeout_error";
      case ErrorKind::Shutdown:
        return "shutdown";
      default:
        return "unknown";
      }
    }

    std::optional<ErrorKind> errorKindFromString(std::string_view text);

    /**
 * @class ProtocolError
 * @brief Thrown while turning bytes into an admitted Command.
 *
 *  * Never escapes a connection handler; it is enveloped (TCP) or logged (UDP).
 */
    class ProtocolError : public std::runtime_error {
    public:
      ProtocolError(ErrorKind kind, const std::string& message)
          : std::runtime_error(message), kind_(kind) {}

      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

  } // namespace protocols
} // namespace cuebridge
