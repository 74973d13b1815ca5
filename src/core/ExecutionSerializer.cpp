/* @file ExecutionSerializer.cpp
 * @brief FIFO single-consumer execution against the non-reentrant host
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// cuebridge headers
#include "core/ExecutionSerializer.hpp"

using namespace cuebridge::core;
using cuebridge::protocols::ErrorKind;
using cuebridge::protocols::Response;

namespace {
  constexpr std::string_view kComponent = "Serializer";
}

ExecutionSerializer::ExecutionSerializer(std::unique_ptr<HostApi> host,
                                         std::shared_ptr<Logger> logger)
    : host_(std::move(host)), logger_(std::move(logger)) {
  if (!host_)
    throw std::invalid_argument("[ExecutionSerializer] host is nullptr");
  if (!logger_)
    throw std::invalid_argument("[ExecutionSerializer] logger is nullptr");
}

ExecutionSerializer::~ExecutionSerializer() { stop(); }

void ExecutionSerializer::start() {
  if (stopped_.load())
    throw std::runtime_error("[ExecutionSerializer] cannot restart a stopped serializer");
  if (running_.exchange(true))
    return;
  worker_ = std::thread([this] { runLoop(); });
  logger_->info(kComponent, "execution thread started");
}

std::optional<std::uint64_t> ExecutionSerializer::submit(ExecutionTask task) {
  {
    std::lock_guard<std::mutex> lock(idleMtx_);
    ++outstanding_;
  }
  auto ticket = queue_.push(std::move(task));
  if (!ticket)
    markDone(); // refused; the caller still owns the outcome
  return ticket;
}

void ExecutionSerializer::stopAccepting() { queue_.close(); }

bool ExecutionSerializer::drain(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(idleMtx_);
  const bool drained = idleCv_.wait_for(lock, grace, [this] { return outstanding_ == 0; });
  if (!drained)
    logger_->warn(kComponent, "drain grace period expired with " +
                                  std::to_string(outstanding_) + " task(s) outstanding");
  return drained;
}

void ExecutionSerializer::stop() {
  if (stopped_.exchange(true))
    return;

  queue_.close();
  running_.store(false);
  if (worker_.joinable())
    worker_.join();

  // whatever is left was accepted but will never run
  std::size_t abandoned = 0;
  while (auto entry = queue_.tryPop()) {
    ++abandoned;
    if (entry->item.completion)
      entry->item.completion->set_value(
          Response::failure(ErrorKind::Shutdown, "Server is shutting down"));
    markDone();
  }
  if (abandoned > 0)
    logger_->warn(kComponent, std::to_string(abandoned) + " queued task(s) not executed");
  logger_->info(kComponent, "execution thread stopped after " +
                                std::to_string(executed_.load()) + " task(s)");
}

void ExecutionSerializer::runLoop() {
  while (running_.load()) {
    auto entry = queue_.pop(kWakeInterval);
    if (!entry) {
      if (queue_.closed())
        break; // closed and empty: nothing can arrive any more
      continue;
    }
    execute(*entry);
  }
}

void ExecutionSerializer::execute(TaskQueue<ExecutionTask>::Entry& entry) {
  const auto& command = entry.item.command;
  Response outcome;
  try {
    outcome = Response::success(host_->invoke(command.kind(), command.params()));
  } catch (const HostError& e) {
    outcome = Response::failure(ErrorKind::HostError, e.what());
  } catch (const std::exception& e) {
    outcome = Response::failure(ErrorKind::HostError, e.what());
  } catch (...) {
    outcome = Response::failure(ErrorKind::HostError, "Unknown host failure");
  }
  ++executed_;
  complete(entry.item, entry.sequence, std::move(outcome));
  markDone();
}

void ExecutionSerializer::complete(ExecutionTask& task, std::uint64_t sequence,
                                   Response outcome) {
  const auto& command = task.command;
  if (!outcome.ok()) {
    ++failed_;
    logger_->warn(kComponent, "#" + std::to_string(sequence) + " " +
                                  std::string(command.name()) + " (" +
                                  std::string(protocols::toString(command.transport())) +
                                  ") failed: " + outcome.message);
  } else {
    logger_->debug(kComponent, "#" + std::to_string(sequence) + " " +
                                   std::string(command.name()) + " (" +
                                   std::string(protocols::toString(command.transport())) +
                                   ") done");
  }

  if (task.completion)
    task.completion->set_value(std::move(outcome));
}

void ExecutionSerializer::markDone() {
  {
    std::lock_guard<std::mutex> lock(idleMtx_);
    --outstanding_;
  }
  idleCv_.notify_all();
}
