#include "geostream/pointcloud/ChunkCache.h"

ChunkCache::ChunkCache(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

std::shared_ptr<const ChunkResult> ChunkCache::find(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

bool ChunkCache::contains(const std::string& key) const {
    return entries_.count(key) != 0;
}

bool ChunkCache::insert(const std::string& key, std::shared_ptr<const ChunkResult> result) {
    if (entries_.count(key) != 0) {
        return false;
    }

    while (entries_.size() >= capacity_ && !order_.empty()) {
        entries_.erase(order_.front());
        order_.pop_front();
    }

    entries_.emplace(key, std::move(result));
    order_.push_back(key);
    return true;
}

void ChunkCache::clear() {
    entries_.clear();
    order_.clear();
}

std::vector<std::string> ChunkCache::keys() const {
    return std::vector<std::string>(order_.begin(), order_.end());
}
