#pragma once
/** @file  ExecutionSerializer.hpp
 *  @brief Single consumer thread; the only caller of the HostApi.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// cuebridge headers
#include "core/HostApi.hpp"
#include "core/Logger.hpp"
#include "core/TaskQueue.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace cuebridge {
  namespace core {

    /// Unit of work. TCP tasks carry a one-shot completion handle, UDP tasks do not.
    struct ExecutionTask {
      protocols::Command command;
      std::optional<std::promise<protocols::Response>> completion{};
    };

    /**
 * @class ExecutionSerializer
 * @brief Runs queued tasks one at a time, strictly in submission order.
 *
 *  * Owns the HostApi; no other component can reach it.
 *  * Every exception thrown by the host is turned into a `host_error`
 *    envelope here, so the consumer thread never dies on a bad task.
 *  * A completion handle nobody waits on any more (timed-out or closed
 *    connection) is still written once; the result is simply unobserved.
 *  * Queued -> Executing -> Completed(notified | discarded). No retries.
 */
    class ExecutionSerializer {
    public:
      ExecutionSerializer(std::unique_ptr<HostApi> host, std::shared_ptr<Logger> logger);
      ~ExecutionSerializer(); ///< stop()

      //---public API------------------------------------------------------
      void start();

      /// @returns the submission sequence number, or std::nullopt once
      ///          stopAccepting()/stop() has been called.
      std::optional<std::uint64_t> submit(ExecutionTask task);

      void stopAccepting();

      /// Wait until every accepted task has completed or \p grace expires.
      /// @returns true if the queue drained in time.
      bool drain(std::chrono::milliseconds grace);

      /// Finish the task in progress, fail whatever is still queued with a
      /// `shutdown` envelope, join the consumer. Idempotent.
      void stop();

      bool running() const noexcept { return running_.load(); }
      std::size_t pending() const { return queue_.size(); }
      std::uint64_t executedCount() const noexcept { return executed_.load(); }
      std::uint64_t failedCount() const noexcept { return failed_.load(); }

      ExecutionSerializer(const ExecutionSerializer&) = delete;
      ExecutionSerializer& operator=(const ExecutionSerializer&) = delete;

    private:
      static constexpr std::chrono::milliseconds kWakeInterval{ 50 };

      void runLoop();
      void execute(TaskQueue<ExecutionTask>::Entry& entry);
      void complete(ExecutionTask& task, std::uint64_t sequence, protocols::Response outcome);
      void markDone();

      std::unique_ptr<HostApi> host_;
      std::shared_ptr<Logger> logger_;
      TaskQueue<ExecutionTask> queue_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<bool> stopped_{ false };

      std::mutex idleMtx_;
      std::condition_variable idleCv_;
      std::uint64_t outstanding_{ 0 }; ///< accepted but not yet completed (guarded by idleMtx_)

      std::atomic<std::uint64_t> executed_{ 0 };
      std::atomic<std::uint64_t> failed_{ 0 };
    };

  } // namespace core
} // namespace cuebridge
