#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

enum class JobState { Queued, Running, Succeeded, Failed };

inline bool is_terminal(JobState s) {
  return s == JobState::Succeeded || s == JobState::Failed;
}

const char* to_string(JobState s);
std::optional<JobState> job_state_from_string(const std::string& s);

// What a finished sync reports back. `error` is only set on Failed jobs.
struct SyncStats {
  uint64_t files_scanned = 0;
  uint64_t files_added = 0;
  uint64_t files_modified = 0;
  uint64_t files_removed = 0;
  uint64_t duration_ms = 0;
  std::optional<std::string> error;
};

// Dedup granularity: one active job per key.
struct QueueKey {
  std::string repo_root;
  std::string tool;
  std::string directory;

  bool operator<(const QueueKey& o) const {
    return std::tie(repo_root, tool, directory) < std::tie(o.repo_root, o.tool, o.directory);
  }
  bool operator==(const QueueKey& o) const {
    return repo_root == o.repo_root && tool == o.tool && directory == o.directory;
  }
};

// One row of the Status command.
struct QueueInfo {
  QueueKey key;
  std::string sync_id;
  JobState state = JobState::Queued;
  uint64_t age_ms = 0;
};
