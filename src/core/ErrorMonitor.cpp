/* @file ErrorMonitor.cpp
 * @brief de-duplicating escalation of fatal subsystem faults
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace cuebridge {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        escalate = escalation_;
      }
      // outside the lock: the callback may call back into shutdown paths
      if (escalate)
        escalate(message);
    }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace cuebridge
