#include "scan_executor.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

ScanExecutor::ScanExecutor(std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("scan")) {}

fs::path ScanExecutor::resolve_directory(const QueueKey& key) {
  fs::path dir(expand_tilde(key.directory));
  if(dir.is_relative() && !key.repo_root.empty()) {
    dir = fs::path(expand_tilde(key.repo_root)) / dir;
  }
  return dir.lexically_normal();
}

SyncStats ScanExecutor::execute(const QueueKey& key) {
  const auto started = std::chrono::steady_clock::now();
  const fs::path root = resolve_directory(key);

  std::error_code ec;
  if(!fs::is_directory(root, ec)) {
    throw std::runtime_error("sync directory does not exist: " + root.string());
  }

  FileIndex::Snapshot snapshot;
  SyncStats stats;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if(ec) throw std::system_error(ec, "cannot scan " + root.string());

  fs::recursive_directory_iterator end;
  for(; it != end; it.increment(ec)) {
    if(ec) {
      logger_->warn("scan of {} interrupted: {}", root.string(), ec.message());
      break;
    }
    std::error_code file_ec;
    if(!it->is_regular_file(file_ec)) continue;

    FileEntry entry;
    entry.path = it->path().lexically_relative(root).generic_string();
    try {
      entry.file_hash = sha256_file_hex(it->path());
    } catch(const std::exception& e) {
      logger_->warn("skipping {}: {}", it->path().string(), e.what());
      continue;
    }
    entry.size = static_cast<uint64_t>(it->file_size(file_ec));
    ++stats.files_scanned;
    snapshot.emplace(entry.path, std::move(entry));
  }

  auto delta = index_.replace(key, std::move(snapshot));
  stats.files_added = delta.added;
  stats.files_modified = delta.modified;
  stats.files_removed = delta.removed;
  stats.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started).count());

  logger_->debug("scanned {} ({} files, {} directories indexed)",
                 root.string(), stats.files_scanned, index_.key_count());
  return stats;
}
