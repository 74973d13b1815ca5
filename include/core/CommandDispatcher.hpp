#pragma once
/** @file  CommandDispatcher.hpp
 *  @brief Admission + hand-off to the serializer, shared by both transports.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <memory>

// cuebridge headers
#include "core/CommandClassifier.hpp"
#include "core/ExecutionSerializer.hpp"
#include "core/Logger.hpp"
#include "protocols/Command.hpp"
#include "protocols/Request.hpp"
#include "protocols/Response.hpp"

namespace cuebridge {
  namespace core {

    /**
 * @class CommandDispatcher
 * @brief Classifies requests and submits them to the ExecutionSerializer.
 *
 *  * `dispatchAndWait` (TCP) always yields exactly one Response.
 *  * `dispatchDetached` (UDP) never yields anything; failures are logged.
 *  * Unknown or transport-disallowed commands never reach the serializer.
 */
    class CommandDispatcher {
    public:
      CommandDispatcher(const CommandClassifier& classifier, ExecutionSerializer& serializer,
                        std::shared_ptr<Logger> logger, std::chrono::milliseconds timeout,
                        std::chrono::milliseconds waitSlice = std::chrono::milliseconds{ 100 });

      //---public API------------------------------------------------------
      /// Classify \p request for \p transport.
      /// @throws protocols::ProtocolError (UnknownCommand | TransportNotAllowed)
      protocols::Command admit(protocols::Request request, protocols::Transport transport) const;

      /// Submit and block for the correlated outcome, bounded by the timeout.
      protocols::Response dispatchAndWait(protocols::Request request);

      /// Fire-and-forget. @returns true if the command was queued.
      bool dispatchDetached(protocols::Request request);

      /// Wake every blocked dispatchAndWait() with a `shutdown` envelope.
      void cancelWaits() noexcept { cancelled_.store(true); }

      std::chrono::milliseconds timeout() const noexcept { return timeout_; }
      std::chrono::milliseconds waitSlice() const noexcept { return waitSlice_; }

    private:
      const CommandClassifier& classifier_;
      ExecutionSerializer& serializer_;
      std::shared_ptr<Logger> logger_;
      std::chrono::milliseconds timeout_;
      std::chrono::milliseconds waitSlice_;
      std::atomic<bool> cancelled_{ false };
    };

  } // namespace core
} // namespace cuebridge
