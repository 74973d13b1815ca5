/* @file Logger.cpp
 * @brief ring-buffered asynchronous logger; the worker owns the sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdio>
#include <ctime>

// cuebridge headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace cuebridge {
  namespace core {

    namespace {
      constexpr std::array<std::string_view, 5> kLevelNames{ "TRACE", "DEBUG", "INFO", "WARN",
                                                             "ERROR" };

      std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        using namespace std::chrono;
        const auto t = system_clock::to_time_t(tp);
        const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[32];
        const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[48];
        std::snprintf(out, sizeof(out), "%.*s.%03d", static_cast<int>(n), buf,
                      static_cast<int>(ms));
        return out;
      }
    } // namespace

    std::string_view toString(LogLevel level) {
      const auto index = static_cast<std::size_t>(level);
      return index < kLevelNames.size() ? kLevelNames[index] : "?????";
    }

    std::optional<LogLevel> logLevelFromString(std::string_view text) {
      if (text == "trace")
        return LogLevel::Trace;
      if (text == "debug")
        return LogLevel::Debug;
      if (text == "info")
        return LogLevel::Info;
      if (text == "warn")
        return LogLevel::Warn;
      if (text == "error")
        return LogLevel::Error;
      return std::nullopt;
    }

    Logger::Logger(std::size_t capacity)
        : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

    Logger::~Logger() { stop(); }

    void Logger::start(std::unique_ptr<io::FileLogger> sink) {
      if (running_.exchange(true))
        return;

      if (!sink) {
        sink = std::make_unique<io::FileLogger>();
        sink->attach(stderr);
      }
      sink_ = std::move(sink);
      worker_ = std::thread([this] { workerLoop(); });
    }

    void Logger::log(const LogEvent& event) {
      if (event.level < level_.load())
        return;
      bool stored = false;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        stored = buffer_->tryPush(event);
      }
      if (!stored) {
        ++dropped_;
        return;
      }
      cv_.notify_one();
    }

    void Logger::stop() {
      if (!running_.exchange(false))
        return;
      { std::lock_guard<std::mutex> lock(mtx_); } // worker is either waiting or re-checking
      cv_.notify_all();
      if (worker_.joinable())
        worker_.join();
      if (sink_)
        sink_->close();
    }

    void Logger::trace(std::string_view component, std::string message) {
      emit(LogLevel::Trace, component, std::move(message));
    }
    void Logger::debug(std::string_view component, std::string message) {
      emit(LogLevel::Debug, component, std::move(message));
    }
    void Logger::info(std::string_view component, std::string message) {
      emit(LogLevel::Info, component, std::move(message));
    }
    void Logger::warn(std::string_view component, std::string message) {
      emit(LogLevel::Warn, component, std::move(message));
    }
    void Logger::error(std::string_view component, std::string message) {
      emit(LogLevel::Error, component, std::move(message));
    }

    void Logger::emit(LogLevel level, std::string_view component, std::string message) {
      log(LogEvent{ std::chrono::system_clock::now(), level, std::string(component),
                    std::move(message) });
    }

    void Logger::workerLoop() {
      std::unique_lock<std::mutex> lock(mtx_);
      for (;;) {
        cv_.wait(lock, [this] { return !buffer_->empty() || !running_.load(); });

        while (auto event = buffer_->tryPop()) {
          lock.unlock(); // format + write without blocking producers
          write(*event);
          lock.lock();
        }
        lock.unlock();
        if (!sink_->flush())
          std::fputs("[Logger] sink flush failed\n", stderr);
        lock.lock();

        if (!running_.load() && buffer_->empty())
          return;
      }
    }

    void Logger::write(const LogEvent& event) {
      std::string line = formatTimestamp(event.timestamp);
      line += " [";
      line += toString(event.level);
      line += "] [";
      line += event.component;
      line += "] ";
      line += event.message;
      line += '\n';
      sink_->write(line);
    }

  } // namespace core
} // namespace cuebridge
