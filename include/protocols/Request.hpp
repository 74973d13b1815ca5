#pragma once
/** @file  Request.hpp
 *  @brief Decoded `{ "type": ..., "params": {...} }` message, before classification.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <string_view>

// 3rd-party headers
#include <nlohmann/json.hpp>

namespace cuebridge {
  namespace protocols {

    struct Request {
      std::string type;
      nlohmann::json params = nlohmann::json::object();

      /// Parse exactly one JSON object; throws ProtocolError(ParseError) on anything else.
      static Request fromWire(std::string_view text);

      std::string toWire() const; ///< compact JSON, no trailing newline
    };

  } // namespace protocols
} // namespace cuebridge
