#pragma once
/** @file  HostApi.hpp
 *  @brief Boundary to the single-threaded, non-reentrant host application.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cuebridge headers
#include "core/CommandKind.hpp"

namespace cuebridge {
  namespace core {

    /// Raised by a HostApi implementation when an operation cannot be applied.
    class HostError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /**
 * @class HostApi
 * @brief Synchronous `invoke(kind, params) -> result` into the host.
 *
 *  * Implementations are not thread-safe and must not be re-entered.
 *  * Exactly one ExecutionSerializer owns an instance; nothing else calls it.
 */
    class HostApi {
    public:
      virtual ~HostApi() = default;

      /// @throws HostError (or any std::exception) when the host rejects the call.
      virtual nlohmann::json invoke(CommandKind kind, const nlohmann::json& params) = 0;
    };

  } // namespace core
} // namespace cuebridge
