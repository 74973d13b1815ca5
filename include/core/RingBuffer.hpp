#pragma once
/** @file  RingBuffer.hpp
 *  @brief Fixed-capacity FIFO ring; callers provide the locking.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace cuebridge {
  namespace core {

    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

      /// @returns false when full (the item is not stored).
      bool tryPush(T item) {
        if (count_ == slots_.size())
          return false;
        slots_[(head_ + count_) % slots_.size()] = std::move(item);
        ++count_;
        return true;
      }

      std::optional<T> tryPop() {
        if (count_ == 0)
          return std::nullopt;
        T item = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
      }

      bool empty() const noexcept { return count_ == 0; }
      std::size_t size() const noexcept { return count_; }
      std::size_t capacity() const noexcept { return slots_.size(); }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
    };

  } // namespace core
} // namespace cuebridge
