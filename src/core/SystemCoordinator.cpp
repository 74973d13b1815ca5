/* @file SystemCoordinator.cpp
 * @brief start-up / shutdown sequencing and fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// cuebridge headers
#include "core/SystemCoordinator.hpp"

using namespace cuebridge::core;

namespace {
  constexpr std::string_view kComponent = "Coordinator";
}

namespace cuebridge::core {
  std::string_view toString(SystemCoordinator::State state) {
    switch (state) {
      case SystemCoordinator::State::Boot:
        return "Boot";
      case SystemCoordinator::State::Init:
        return "Init";
      case SystemCoordinator::State::Running:
        return "Running";
      case SystemCoordinator::State::Draining:
        return "Draining";
      case SystemCoordinator::State::Stopped:
        return "Stopped";
      case SystemCoordinator::State::Error:
        return "Error";
    }
    return "?";
  }
} // namespace cuebridge::core

SystemCoordinator::SystemCoordinator(ServerConfig config, std::unique_ptr<HostApi> host,
                                     std::shared_ptr<Logger> logger,
                                     std::shared_ptr<ErrorMonitor> errorMonitor)
    : config_(std::move(config)), logger_(std::move(logger)),
      errorMonitor_(std::move(errorMonitor)), serializer_(std::move(host), logger_),
      dispatcher_(classifier_, serializer_, logger_, config_.requestTimeout),
      tcp_(dispatcher_, logger_, errorMonitor_, config_),
      udp_(dispatcher_, logger_, errorMonitor_, config_) {
  errorMonitor_->registerEscalation([this](const std::string& reason) { onFatal(reason); });
}

SystemCoordinator::~SystemCoordinator() {
  shutdown();
  errorMonitor_->registerEscalation(nullptr);
}

void SystemCoordinator::initialize() {
  if (state_.load() != State::Boot)
    throw std::logic_error("[SystemCoordinator] initialize() called twice");

  try {
    config_.validate();
    tcp_.bind();
    udp_.bind();
  } catch (const std::exception& e) {
    faulted_.store(true);
    transitionTo(State::Error);
    logger_->error(kComponent, std::string("start-up failed: ") + e.what());
    throw;
  }
  serializer_.start();
  transitionTo(State::Init);
}

void SystemCoordinator::start() {
  if (state_.load() != State::Init)
    throw std::logic_error("[SystemCoordinator] start() requires a successful initialize()");

  tcp_.start();
  udp_.start();
  transitionTo(State::Running);
  logger_->info(kComponent, "bridge up: tcp " + std::to_string(tcp_.port()) + ", udp " +
                                std::to_string(udp_.port()));
}

void SystemCoordinator::requestShutdown() {
  {
    std::lock_guard<std::mutex> lock(requestMtx_);
    shutdownRequested_ = true;
  }
  requestCv_.notify_all();
}

bool SystemCoordinator::waitForShutdownRequest(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(requestMtx_);
  return requestCv_.wait_for(lock, timeout, [this] { return shutdownRequested_; });
}

// -------------------------------------------------------------------
// SystemCoordinator::shutdown
// Draining keeps already accepted work alive for shutdown_grace; after
// that, waiters get a `shutdown` envelope and leftovers are failed.
// -------------------------------------------------------------------
void SystemCoordinator::shutdown() {
  std::lock_guard<std::mutex> lock(shutdownMtx_);
  if (shutdownDone_)
    return;
  shutdownDone_ = true;

  const bool wasUp = state_.load() == State::Init || state_.load() == State::Running;
  if (wasUp)
    transitionTo(State::Draining);

  tcp_.stopAccepting();
  udp_.stop();

  serializer_.stopAccepting();
  if (!serializer_.drain(config_.shutdownGrace))
    logger_->warn(kComponent, "grace period expired with " +
                                  std::to_string(serializer_.pending()) + " queued commands");

  dispatcher_.cancelWaits();
  // a released waiter needs one wait slice to notice, one poll tick to leave its read
  tcp_.closeConnections(2 * (dispatcher_.waitSlice() + config_.pollInterval));
  serializer_.stop();

  transitionTo(faulted_.load() ? State::Error : State::Stopped);
  logger_->info(kComponent, "bridge down (" + std::to_string(serializer_.executedCount()) +
                                " commands executed, " +
                                std::to_string(serializer_.failedCount()) + " failed)");
}

void SystemCoordinator::transitionTo(State next) {
  const State previous = state_.exchange(next);
  if (previous != next)
    logger_->debug(kComponent,
                   std::string(toString(previous)) + " -> " + std::string(toString(next)));
}

void SystemCoordinator::onFatal(const std::string& reason) {
  logger_->error(kComponent, "fatal: " + reason);
  faulted_.store(true);
  requestShutdown();
}
