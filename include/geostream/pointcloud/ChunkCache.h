#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "geostream/pointcloud/ChunkTypes.h"

// Insertion-ordered cache of processed chunks. Entries are immutable once
// inserted; overflow evicts the oldest insertion.
class ChunkCache {
public:
    static constexpr std::size_t kDefaultCapacity = 20;

    explicit ChunkCache(std::size_t capacity = kDefaultCapacity);

    std::shared_ptr<const ChunkResult> find(const std::string& key) const;
    bool contains(const std::string& key) const;

    // Returns false when the key is already present; the original entry is kept.
    bool insert(const std::string& key, std::shared_ptr<const ChunkResult> result);
    void clear();

    std::size_t size() const {
        return entries_.size();
    }

    std::size_t capacity() const {
        return capacity_;
    }

    // Oldest first.
    std::vector<std::string> keys() const;

private:
    std::size_t capacity_;
    std::deque<std::string> order_;
    std::unordered_map<std::string, std::shared_ptr<const ChunkResult>> entries_;
};
