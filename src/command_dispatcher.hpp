#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "protocol.hpp"
#include "sync_queue.hpp"

// The one place that maps a decoded, version-checked request onto the queue.
class CommandDispatcher {
public:
  using ResponseHandler = std::function<void(Response)>;
  using ShutdownTrigger = std::function<void(const std::string& reason)>;

  CommandDispatcher(SyncQueue& queue,
                    ShutdownTrigger shutdown,
                    std::shared_ptr<Logger> logger = nullptr);

  // `done` is called exactly once. It runs inline for every command except
  // WaitSync, whose response arrives from the queue's waiter.
  void dispatch(const Request& request, ResponseHandler done);

  uint64_t uptime_ms() const;

private:
  Response handle_ping(const Request& request) const;
  Response handle_enqueue(const Request& request, const EnqueueSyncCommand& cmd);
  Response handle_status(const Request& request) const;
  Response handle_shutdown(const Request& request, const ShutdownCommand& cmd);
  void handle_wait(const Request& request, const WaitSyncCommand& cmd, ResponseHandler done);

  SyncQueue& queue_;
  ShutdownTrigger shutdown_;
  std::shared_ptr<Logger> logger_;
  std::chrono::steady_clock::time_point start_time_;
};
