#pragma once
/** @file  Command.hpp
 *  @brief Immutable, classified command ready for the serializer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string_view>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cuebridge headers
#include "core/CommandKind.hpp"
#include "protocols/Transport.hpp"

namespace cuebridge {
  namespace protocols {

    /**
 * @class Command
 * @brief Value created once a transport has parsed and admitted a message.
 *
 *  * No setters: the serializer sees exactly what the transport parsed.
 */
    class Command {
    public:
      using Clock = std::chrono::system_clock;

      Command(core::CommandKind kind, nlohmann::json params, Transport transport,
              Clock::time_point receivedAt = Clock::now())
          : kind_(kind), params_(std::move(params)), transport_(transport),
            receivedAt_(receivedAt) {}

      core::CommandKind kind() const noexcept { return kind_; }
      std::string_view name() const { return core::toString(kind_); }
      const nlohmann::json& params() const noexcept { return params_; }
      Transport transport() const noexcept { return transport_; }
      Clock::time_point receivedAt() const noexcept { return receivedAt_; }

    private:
      core::CommandKind kind_;
      nlohmann::json params_;
      Transport transport_;
      Clock::time_point receivedAt_;
    };

  } // namespace protocols
} // namespace cuebridge
