#pragma once
/** @file  TaskQueue.hpp
 *  @brief Unbounded multi-producer / single-consumer FIFO with submission tickets.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace cuebridge {
  namespace core {

    /**
 * @class TaskQueue
 * @brief Producers push from any thread; one consumer pops in arrival order.
 *
 *  * Every accepted push gets the next sequence number under the same lock
 *    that orders the deque, so ticket order == pop order.
 *  * After close() pushes are refused; pop() still hands out what is queued.
 */
    template <typename T> class TaskQueue {
    public:
      struct Entry {
        std::uint64_t sequence;
        T item;
      };

      /// @returns the ticket, or std::nullopt once closed.
      std::optional<std::uint64_t> push(T item) {
        std::uint64_t ticket = 0;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (closed_)
            return std::nullopt;
          ticket = nextSequence_++;
          items_.push_back(Entry{ ticket, std::move(item) });
        }
        cv_.notify_one();
        return ticket;
      }

      /// Blocks up to \p timeout; std::nullopt on timeout or when closed and empty.
      std::optional<Entry> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty())
          return std::nullopt;
        Entry entry = std::move(items_.front());
        items_.pop_front();
        return entry;
      }

      /// Non-blocking pop used when flushing after shutdown.
      std::optional<Entry> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (items_.empty())
          return std::nullopt;
        Entry entry = std::move(items_.front());
        items_.pop_front();
        return entry;
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
      }

    private:
      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<Entry> items_;
      std::uint64_t nextSequence_{ 1 };
      bool closed_{ false };
    };

  } // namespace core
} // namespace cuebridge
