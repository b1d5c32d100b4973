#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "sync_types.hpp"

// Wire timeouts are unsigned milliseconds; anything past what a steady_timer
// can hold is treated as the longest representable wait.
std::chrono::milliseconds clamp_wait_timeout(uint64_t timeout_ms);

// The work behind a sync. Implementations own no queue state: the queue calls
// execute() on one of its worker threads and records the outcome itself.
class SyncExecutor {
public:
  virtual ~SyncExecutor() = default;

  // Runs one sync for `key` and returns its stats. Throwing marks the job Failed.
  virtual SyncStats execute(const QueueKey& key) = 0;
};

struct JobSnapshot {
  std::string sync_id;
  QueueKey key;
  JobState state = JobState::Queued;
  std::chrono::steady_clock::time_point queued_at;
  uint64_t queued_at_ms = 0;   // wall clock, ms since epoch
  std::optional<SyncStats> stats;
};

struct EnqueueResult {
  std::string sync_id;
  bool is_new = false;
};

// Admission-controlled job table. At most one Queued/Running job exists per
// QueueKey; all table reads and writes go through one mutex and handlers are
// always invoked outside of it.
class SyncQueue {
public:
  // Called exactly once: the terminal snapshot, or nullopt on timeout /
  // unknown sync_id.
  using WaitHandler = std::function<void(std::optional<JobSnapshot>)>;

  SyncQueue(asio::io_context& io,
            std::shared_ptr<SyncExecutor> executor,
            std::size_t workers = 4,
            std::shared_ptr<Logger> logger = nullptr);
  ~SyncQueue();

  SyncQueue(const SyncQueue&) = delete;
  SyncQueue& operator=(const SyncQueue&) = delete;

  EnqueueResult enqueue(const std::string& repo_root,
                        const std::string& tool,
                        const std::string& directory,
                        bool force);

  std::optional<JobSnapshot> get(const std::string& sync_id) const;

  void async_wait(const std::string& sync_id,
                  std::chrono::milliseconds timeout,
                  WaitHandler handler);

  std::vector<QueueInfo> list_queues() const;

  // Completion interface used by the worker that runs a job.
  bool mark_running(const std::string& sync_id);
  bool complete(const std::string& sync_id, JobState final_state, SyncStats stats);

  // Waits for in-flight executions; jobs not yet started are abandoned.
  void stop();

  std::size_t job_count() const;

private:
  struct Waiter;

  struct Job {
    JobSnapshot info;
    std::vector<std::shared_ptr<Waiter>> waiters;
  };

  void run_job(const std::string& sync_id, const QueueKey& key);
  void drop_waiter(const std::string& sync_id, const std::shared_ptr<Waiter>& waiter);
  std::string fresh_sync_id() const;

  asio::io_context& io_;
  std::shared_ptr<SyncExecutor> executor_;
  asio::thread_pool workers_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<std::string, Job> jobs_;   // sync_id -> job
  std::map<QueueKey, std::string> current_;      // key -> sync_id of its newest job
};
