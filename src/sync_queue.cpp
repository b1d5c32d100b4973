#include "sync_queue.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace {

// Leaves headroom so now() + timeout stays inside steady_clock.
const std::chrono::milliseconds kMaxWaitTimeout =
  std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::duration::max()) -
  std::chrono::hours(24);

uint64_t wall_clock_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
    duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  using namespace std::chrono;
  auto d = duration_cast<milliseconds>(steady_clock::now() - since).count();
  return d > 0 ? static_cast<uint64_t>(d) : 0;
}

} // namespace

std::chrono::milliseconds clamp_wait_timeout(uint64_t timeout_ms) {
  if(timeout_ms >= static_cast<uint64_t>(kMaxWaitTimeout.count())) return kMaxWaitTimeout;
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(timeout_ms));
}

// A pending WaitSync. The timer and the completion path race to fire() on the
// waiter's strand; only the first one reaches the handler.
struct SyncQueue::Waiter {
  Waiter(asio::io_context& io, std::string id, WaitHandler h)
    : strand(asio::make_strand(io)),
      timer(strand),
      sync_id(std::move(id)),
      handler(std::move(h)) {}

  void fire(std::optional<JobSnapshot> result) {
    if(fired.exchange(true)) return;
    auto h = std::move(handler);
    if(h) h(std::move(result));
  }

  asio::strand<asio::io_context::executor_type> strand;
  asio::steady_timer timer;
  std::string sync_id;
  WaitHandler handler;
  std::atomic<bool> fired{false};
};

SyncQueue::SyncQueue(asio::io_context& io,
                     std::shared_ptr<SyncExecutor> executor,
                     std::size_t workers,
                     std::shared_ptr<Logger> logger)
  : io_(io),
    executor_(std::move(executor)),
    workers_(workers == 0 ? 1 : workers),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("sync-queue")) {
  if(!executor_) throw std::invalid_argument("SyncQueue requires an executor");
}

SyncQueue::~SyncQueue() {
  stop();
}

void SyncQueue::stop() {
  workers_.stop();
  workers_.join();
}

std::string SyncQueue::fresh_sync_id() const {
  std::string id = random_uuid();
  while(jobs_.count(id)) id = random_uuid();
  return id;
}

EnqueueResult SyncQueue::enqueue(const std::string& repo_root,
                                 const std::string& tool,
                                 const std::string& directory,
                                 bool force) {
  QueueKey key{repo_root, tool, directory};
  EnqueueResult result;
  {
    std::lock_guard lg(m_);
    auto cur = current_.find(key);
    if(cur != current_.end()) {
      auto jt = jobs_.find(cur->second);
      if(jt != jobs_.end()) {
        if(!is_terminal(jt->second.info.state) && !force) {
          result.sync_id = jt->second.info.sync_id;
          result.is_new = false;
          logger_->debug("sync {} already active for {}:{}:{}", result.sync_id, tool, repo_root, directory);
          return result;
        }
        // superseded: a finished job leaves the table now, an active one
        // when it completes
        if(is_terminal(jt->second.info.state)) jobs_.erase(jt);
      }
    }

    Job job;
    job.info.sync_id = fresh_sync_id();
    job.info.key = key;
    job.info.state = JobState::Queued;
    job.info.queued_at = std::chrono::steady_clock::now();
    job.info.queued_at_ms = wall_clock_ms();

    result.sync_id = job.info.sync_id;
    result.is_new = true;
    current_[key] = result.sync_id;
    jobs_.emplace(result.sync_id, std::move(job));
  }

  logger_->info("queued sync {} for {}:{}:{}{}", result.sync_id, tool, repo_root, directory,
                force ? " (forced)" : "");
  asio::post(workers_, [this, id = result.sync_id, key = std::move(key)](){
    run_job(id, key);
  });
  return result;
}

void SyncQueue::run_job(const std::string& sync_id, const QueueKey& key) {
  // settled before a worker got to it
  if(!mark_running(sync_id)) return;
  const auto started = std::chrono::steady_clock::now();
  try {
    SyncStats stats = executor_->execute(key);
    if(stats.duration_ms == 0) stats.duration_ms = elapsed_ms(started);
    complete(sync_id, JobState::Succeeded, std::move(stats));
  } catch(const std::exception& e) {
    SyncStats stats;
    stats.duration_ms = elapsed_ms(started);
    stats.error = e.what();
    complete(sync_id, JobState::Failed, std::move(stats));
  } catch(...) {
    SyncStats stats;
    stats.duration_ms = elapsed_ms(started);
    stats.error = "executor threw a non-standard exception";
    complete(sync_id, JobState::Failed, std::move(stats));
  }
}

bool SyncQueue::mark_running(const std::string& sync_id) {
  std::lock_guard lg(m_);
  auto it = jobs_.find(sync_id);
  if(it == jobs_.end() || it->second.info.state != JobState::Queued) return false;
  it->second.info.state = JobState::Running;
  return true;
}

bool SyncQueue::complete(const std::string& sync_id, JobState final_state, SyncStats stats) {
  if(!is_terminal(final_state)) return false;

  std::vector<std::shared_ptr<Waiter>> waiters;
  JobSnapshot snapshot;
  {
    std::lock_guard lg(m_);
    auto it = jobs_.find(sync_id);
    if(it == jobs_.end() || is_terminal(it->second.info.state)) return false;
    it->second.info.state = final_state;
    it->second.info.stats = std::move(stats);
    waiters.swap(it->second.waiters);
    snapshot = it->second.info;

    auto cur = current_.find(snapshot.key);
    if(cur == current_.end() || cur->second != sync_id) {
      jobs_.erase(it);
    }
  }

  if(final_state == JobState::Succeeded) {
    logger_->info("sync {} succeeded ({} scanned, {} added, {} modified, {} removed, {} ms)",
                  sync_id, snapshot.stats->files_scanned, snapshot.stats->files_added,
                  snapshot.stats->files_modified, snapshot.stats->files_removed,
                  snapshot.stats->duration_ms);
  } else {
    logger_->warn("sync {} failed: {}", sync_id, snapshot.stats->error.value_or("unknown error"));
  }

  for(auto& w : waiters) {
    asio::post(w->strand, [w, snapshot](){
      w->timer.cancel();
      w->fire(snapshot);
    });
  }
  return true;
}

std::optional<JobSnapshot> SyncQueue::get(const std::string& sync_id) const {
  std::lock_guard lg(m_);
  auto it = jobs_.find(sync_id);
  if(it == jobs_.end()) return std::nullopt;
  return it->second.info;
}

void SyncQueue::async_wait(const std::string& sync_id,
                           std::chrono::milliseconds timeout,
                           WaitHandler handler) {
  timeout = std::clamp(timeout, std::chrono::milliseconds::zero(), kMaxWaitTimeout);
  auto waiter = std::make_shared<Waiter>(io_, sync_id, std::move(handler));
  std::optional<JobSnapshot> resolved;
  bool known = false;
  {
    std::lock_guard lg(m_);
    auto it = jobs_.find(sync_id);
    if(it != jobs_.end()) {
      known = true;
      if(is_terminal(it->second.info.state)) {
        resolved = it->second.info;
      } else {
        it->second.waiters.push_back(waiter);
      }
    }
  }

  if(!known || resolved) {
    if(!known) logger_->debug("wait on unknown sync {}", sync_id);
    asio::post(waiter->strand, [waiter, resolved = std::move(resolved)]() mutable {
      waiter->fire(std::move(resolved));
    });
    return;
  }

  asio::dispatch(waiter->strand, [this, waiter, timeout](){
    if(waiter->fired) return;
    waiter->timer.expires_after(timeout);
    waiter->timer.async_wait([this, waiter](const std::error_code& ec){
      if(ec == asio::error::operation_aborted) return;
      drop_waiter(waiter->sync_id, waiter);
      waiter->fire(std::nullopt);
    });
  });
}

void SyncQueue::drop_waiter(const std::string& sync_id, const std::shared_ptr<Waiter>& waiter) {
  std::lock_guard lg(m_);
  auto it = jobs_.find(sync_id);
  if(it == jobs_.end()) return;
  auto& list = it->second.waiters;
  for(auto w = list.begin(); w != list.end(); ++w) {
    if(*w == waiter) {
      list.erase(w);
      return;
    }
  }
}

std::vector<QueueInfo> SyncQueue::list_queues() const {
  std::vector<QueueInfo> out;
  std::lock_guard lg(m_);
  out.reserve(current_.size());
  for(const auto& [key, sync_id] : current_) {
    auto it = jobs_.find(sync_id);
    if(it == jobs_.end()) continue;
    QueueInfo info;
    info.key = key;
    info.sync_id = sync_id;
    info.state = it->second.info.state;
    info.age_ms = elapsed_ms(it->second.info.queued_at);
    out.push_back(std::move(info));
  }
  return out;
}

std::size_t SyncQueue::job_count() const {
  std::lock_guard lg(m_);
  return jobs_.size();
}
