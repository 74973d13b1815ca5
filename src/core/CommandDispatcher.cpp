/* @file CommandDispatcher.cpp
 * @brief request admission and correlated waiting for TCP, fire-and-forget for UDP
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>

// cuebridge headers
#include "core/CommandDispatcher.hpp"

using namespace cuebridge::core;
using cuebridge::protocols::Command;
using cuebridge::protocols::ErrorKind;
using cuebridge::protocols::ProtocolError;
using cuebridge::protocols::Request;
using cuebridge::protocols::Response;
using cuebridge::protocols::Transport;

namespace {
  constexpr std::string_view kComponent = "Dispatcher";
}

CommandDispatcher::CommandDispatcher(const CommandClassifier& classifier,
                                     ExecutionSerializer& serializer,
                                     std::shared_ptr<Logger> logger,
                                     std::chrono::milliseconds timeout,
                                     std::chrono::milliseconds waitSlice)
    : classifier_(classifier), serializer_(serializer), logger_(std::move(logger)),
      timeout_(timeout), waitSlice_(waitSlice) {
  if (!logger_)
    throw std::invalid_argument("[CommandDispatcher] logger is nullptr");
  if (timeout_.count() <= 0 || waitSlice_.count() <= 0)
    throw std::invalid_argument("[CommandDispatcher] timeouts must be positive");
}

Command CommandDispatcher::admit(Request request, Transport transport) const {
  auto entry = classifier_.classify(request.type);
  if (!entry)
    throw ProtocolError(ErrorKind::UnknownCommand, "Unknown command: " + request.type);

  if (!entry->allows(transport))
    throw ProtocolError(ErrorKind::TransportNotAllowed,
                        "Command '" + request.type + "' is not allowed over " +
                            std::string(protocols::toString(transport)));

  return Command(entry->kind, std::move(request.params), transport);
}

Response CommandDispatcher::dispatchAndWait(Request request) {
  std::optional<Command> command;
  try {
    command.emplace(admit(std::move(request), Transport::Tcp));
  } catch (const ProtocolError& e) {
    logger_->info(kComponent, std::string("rejected TCP request: ") + e.what());
    return Response::failure(e.kind(), e.what());
  }

  std::promise<Response> promise;
  auto future = promise.get_future();
  const std::string name(command->name());

  auto ticket = serializer_.submit(ExecutionTask{ std::move(*command), std::move(promise) });
  if (!ticket)
    return Response::failure(ErrorKind::Shutdown, "Server is shutting down");

  // wait in slices so a shutdown does not leave the caller blocked for the full timeout
  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  for (;;) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;
    const auto slice = std::min<std::chrono::steady_clock::duration>(waitSlice_, deadline - now);
    if (future.wait_for(slice) == std::future_status::ready)
      return future.get();
    if (cancelled_.load())
      return Response::failure(ErrorKind::Shutdown, "Server is shutting down");
  }
  if (future.wait_for(std::chrono::seconds::zero()) == std::future_status::ready)
    return future.get();

  // the task stays queued / running; only this caller stops waiting
  logger_->warn(kComponent, "#" + std::to_string(*ticket) + " " + name + " timed out after " +
                                std::to_string(timeout_.count()) + " ms");
  return Response::failure(ErrorKind::TimeoutError, "Timeout waiting for operation to complete");
}

bool CommandDispatcher::dispatchDetached(Request request) {
  try {
    auto command = admit(std::move(request), Transport::Udp);
    const std::string name(command.name());
    if (!serializer_.submit(ExecutionTask{ std::move(command), std::nullopt })) {
      logger_->debug(kComponent, "dropped UDP " + name + ": not accepting work");
      return false;
    }
    return true;
  } catch (const ProtocolError& e) {
    logger_->warn(kComponent, std::string("dropped UDP datagram: ") + e.what());
    return false;
  }
}
