#include "file_index.hpp"

IndexDelta FileIndex::replace(const QueueKey& key, Snapshot snapshot){
    std::lock_guard lg(m_);
    IndexDelta delta;
    auto& previous = map_[key];
    for(const auto& [path, entry] : snapshot){
        auto it = previous.find(path);
        if(it == previous.end()) ++delta.added;
        else if(it->second.file_hash != entry.file_hash) ++delta.modified;
    }
    for(const auto& kv : previous){
        if(!snapshot.count(kv.first)) ++delta.removed;
    }
    previous = std::move(snapshot);
    return delta;
}

std::size_t FileIndex::key_count() const {
    std::lock_guard lg(m_);
    return map_.size();
}
