#pragma once
/** @file  Response.hpp
 *  @brief Result / error envelope, the only two outcomes visible on the wire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cuebridge headers
#include "protocols/ProtocolError.hpp"

namespace cuebridge {
  namespace protocols {

    struct Response {
      enum class Status { Success, Error };

      Status status{ Status::Success };
      nlohmann::json result = nlohmann::json::object(); ///< success payload
      std::string message{};                           ///< error text
      std::optional<ErrorKind> errorKind{};

      static Response success(nlohmann::json result);
      static Response failure(ErrorKind kind, std::string message);

      bool ok() const noexcept { return status == Status::Success; }

      /// `{"status":"success","result":{...}}` or
      /// `{"status":"error","message":"...","error_kind":"..."}` plus '\n'.
      std::string toWire() const;

      /// Tolerant decoder for clients; std::nullopt if the text is not an envelope.
      static std::optional<Response> fromWire(const std::string& text);
    };

  } // namespace protocols
} // namespace cuebridge
