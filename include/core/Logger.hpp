#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous line logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace cuebridge {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error };

    std::string_view toString(LogLevel level);
    std::optional<LogLevel> logLevelFromString(std::string_view text);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp;
      LogLevel level;
      std::string component;
      std::string message;
    };

    /**
 * @class Logger
 * @brief Any thread enqueues, the worker formats and writes.
 *
 *  * `log()` never touches the sink; if the ring is full the event is dropped
 *    and counted instead of stalling a transport thread.
 *  * Events logged before `start()` are kept (up to capacity) and written
 *    once the worker runs.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 4096);
      virtual ~Logger(); ///< stop() + flush

      // --- public API ---
      /// Launch the worker. A null sink writes to stderr.
      void start(std::unique_ptr<io::FileLogger> sink = nullptr);
      virtual void log(const LogEvent& event); ///< enqueue event (non-blocking)
      void stop();                             ///< flush + join worker thread

      void trace(std::string_view component, std::string message);
      void debug(std::string_view component, std::string message);
      void info(std::string_view component, std::string message);
      void warn(std::string_view component, std::string message);
      void error(std::string_view component, std::string message);

      void setLevel(LogLevel level) noexcept { level_.store(level); }
      LogLevel level() const noexcept { return level_.load(); }
      std::uint64_t dropped() const noexcept { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void emit(LogLevel level, std::string_view component, std::string message);
      void workerLoop();
      void write(const LogEvent& event);

      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::unique_ptr<io::FileLogger> sink_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> level_{ LogLevel::Info };
      std::atomic<std::uint64_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace cuebridge
