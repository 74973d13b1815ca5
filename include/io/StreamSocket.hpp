#pragma once
/** @file  StreamSocket.hpp
 *  @brief Connected TCP socket with poll-bounded reads and full writes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>

namespace cuebridge {
  namespace io {

    /**
 * @class StreamSocket
 * @brief RAII wrapper around one accepted socket file descriptor.
 *
 *  * Reads return whatever arrived (no framing here).
 *  * Writes loop until every byte is out; SIGPIPE is suppressed.
 *  * shutdown() may be called from any thread; it and close() are
 *    serialized so a descriptor is never shut down after it was released.
 *  * *Non-copyable*, but move-constructible.
 */

    class StreamSocket {

    public:
      enum class ReadStatus { Data, Timeout, Closed, Error };

      struct ReadResult {
        ReadStatus status;
        std::string bytes{};
      };

      //---ctr / dtr--------------------------------------------
      StreamSocket() = default;
      explicit StreamSocket(int fd) : fd_(fd) {}
      virtual ~StreamSocket(); // close the fd at destruction

      //---public API-------------------------------------------
      virtual ReadResult read(std::chrono::milliseconds timeout);
      virtual bool writeAll(std::string_view data); // returns false on EPIPE/ECONNRESET/...
      virtual void shutdown();                      // wakes a reader blocked on another thread
      void close();

      bool isOpen() const noexcept { return fd_.load() >= 0; }
      int fd() const noexcept { return fd_.load(); }

      //---non-copyable-----------------------------------------
      StreamSocket(const StreamSocket&) = delete;
      StreamSocket& operator=(const StreamSocket&) = delete;

      //---mv and mv assign-------------------------------------
      StreamSocket(StreamSocket&& other) noexcept;
      StreamSocket& operator=(StreamSocket&& other) noexcept;

    private:
      static constexpr std::size_t kReadChunk = 8192;
      static constexpr int kWriteStallMs = 5000; ///< give up on a peer that stops reading

      std::atomic<int> fd_{ -1 }; ///< POSIX fd (-1==closed)
      std::mutex releaseMtx_;     ///< held by close() and shutdown()
    };
  } // namespace io
} // namespace cuebridge
