#include "command_dispatcher.hpp"

#include <utility>
#include <variant>

CommandDispatcher::CommandDispatcher(SyncQueue& queue,
                                     ShutdownTrigger shutdown,
                                     std::shared_ptr<Logger> logger)
  : queue_(queue),
    shutdown_(std::move(shutdown)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("dispatcher")),
    start_time_(std::chrono::steady_clock::now()) {}

uint64_t CommandDispatcher::uptime_ms() const {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now() - start_time_).count());
}

void CommandDispatcher::dispatch(const Request& request, ResponseHandler done) {
  logger_->debug("{} request {} from {} ({})", command_type(request.command), request.id,
                 request.tool, request.repo_root);

  std::optional<Response> response;
  try {
    if(auto* wait = std::get_if<WaitSyncCommand>(&request.command)) {
      handle_wait(request, *wait, std::move(done));
      return;
    }
    if(std::holds_alternative<PingCommand>(request.command)) {
      response = handle_ping(request);
    } else if(auto* enqueue = std::get_if<EnqueueSyncCommand>(&request.command)) {
      response = handle_enqueue(request, *enqueue);
    } else if(std::holds_alternative<StatusCommand>(request.command)) {
      response = handle_status(request);
    } else if(auto* shutdown = std::get_if<ShutdownCommand>(&request.command)) {
      response = handle_shutdown(request, *shutdown);
    }
  } catch(const std::exception& e) {
    logger_->error("{} request {} failed: {}", command_type(request.command), request.id, e.what());
    response = Response::failure(request.id, ErrorCode::InternalError, e.what());
  }

  if(!response) {
    response = Response::failure(request.id, ErrorCode::InternalError, "unhandled command");
  }
  if(done) done(std::move(*response));
}

Response CommandDispatcher::handle_ping(const Request& request) const {
  return Response::success(request.id, make_ping_payload(kDaemonVersion));
}

Response CommandDispatcher::handle_enqueue(const Request& request, const EnqueueSyncCommand& cmd) {
  auto result = queue_.enqueue(request.repo_root, request.tool, cmd.directory, cmd.force);
  auto job = queue_.get(result.sync_id);
  if(!job) {
    return Response::failure(request.id, ErrorCode::InternalError, "Failed to create sync job");
  }
  return Response::success(request.id,
                           make_enqueue_payload(result.sync_id, job->queued_at_ms, result.is_new));
}

void CommandDispatcher::handle_wait(const Request& request, const WaitSyncCommand& cmd, ResponseHandler done) {
  queue_.async_wait(cmd.sync_id, clamp_wait_timeout(cmd.timeout_ms),
    [id = request.id, sync_id = cmd.sync_id, done = std::move(done)](std::optional<JobSnapshot> job){
      if(!job) {
        done(Response::failure(id, ErrorCode::Timeout, "Timeout waiting for sync " + sync_id));
        return;
      }
      done(Response::success(id, make_wait_payload(sync_id, job->state, job->stats)));
    });
}

Response CommandDispatcher::handle_status(const Request& request) const {
  return Response::success(request.id, make_status_payload(queue_.list_queues(), uptime_ms()));
}

Response CommandDispatcher::handle_shutdown(const Request& request, const ShutdownCommand& cmd) {
  logger_->info("Shutdown requested by {}: {}", request.tool, cmd.reason.empty() ? "(no reason)" : cmd.reason);
  if(shutdown_) shutdown_(cmd.reason);
  return Response::success(request.id, make_shutdown_payload());
}
