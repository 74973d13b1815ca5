#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace cuebridge::core {

  /**
 * @class ErrorMonitor
 * @brief Listener threads call `notifyFailure()` on faults they cannot
 *        recover from; we call the registered escalation callback exactly
 *        once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so SystemCoordinator doesn’t get spammed.
 * * Per-request errors (bad JSON, host errors) never come through here.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fatal fault to SystemCoordinator.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of distinct failures seen so far.
    std::size_t failureCount() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace cuebridge::core
