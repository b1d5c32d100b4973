#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "sync_types.hpp"

struct FileEntry {
    std::string path;      // relative to the synced directory
    std::string file_hash; // hex sha256
    uint64_t size = 0;
};

struct IndexDelta {
    uint64_t added = 0;
    uint64_t modified = 0;
    uint64_t removed = 0;
};

// Last known contents of every synced directory, one snapshot per QueueKey.
class FileIndex {
public:
    using Snapshot = std::unordered_map<std::string, FileEntry>; // path -> entry

    // Swaps in a new snapshot for `key` and reports how it differs from the old one.
    IndexDelta replace(const QueueKey& key, Snapshot snapshot);

    // Number of directories with a stored snapshot.
    std::size_t key_count() const;

private:
    mutable std::mutex m_;
    std::map<QueueKey, Snapshot> map_;
};
