#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for a log file or a standard stream.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace cuebridge {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Appends; never truncates an existing log.
 *  * Buffers up to 4 kB before hitting `std::fwrite`.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Borrow an already-open stream (stderr); it is flushed but never closed. */
      bool attach(FILE* stream);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const noexcept { return fp_ != nullptr; }

      //---non-copyable, non-movable (owned through unique_ptr)-------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      bool owned_{ false };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace cuebridge
