#pragma once
#include <filesystem>
#include <memory>

#include "file_index.hpp"
#include "log.hpp"
#include "sync_queue.hpp"

// Default executor for the daemon binary: hashes every regular file under the
// key's directory and diffs the result against the previous scan of that key.
class ScanExecutor : public SyncExecutor {
public:
  explicit ScanExecutor(std::shared_ptr<Logger> logger = nullptr);

  SyncStats execute(const QueueKey& key) override;

  // Relative directories are taken against repo_root.
  static std::filesystem::path resolve_directory(const QueueKey& key);

private:
  FileIndex index_;
  std::shared_ptr<Logger> logger_;
};
