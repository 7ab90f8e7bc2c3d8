#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "geostream/pointcloud/PointLayout.h"

using ChunkBytes = std::vector<uint8_t>;

struct ChunkRequest {
    // Stable identity of the chunk; when empty the content hash is used.
    std::string chunkId;
    std::shared_ptr<const ChunkBytes> buffer;
    uint32_t pointCount = 0;
    uint32_t recordStride = 0;
    std::string format;
    std::vector<AttributeDesc> attributes;
};

using PointFilter = std::function<bool(const DecodedPoint&)>;

struct ChunkOptions {
    PointFilter filter;
    // Names the filter for cache keying. A filter without a key is never cached.
    std::string filterKey;
    uint32_t simplifyFactor = 1;
    std::optional<glm::mat4> transform;
};

struct ChunkResult {
    bool success = false;
    std::shared_ptr<const ChunkBytes> buffer;
    uint32_t pointCount = 0;
    uint32_t recordStride = 0;
    std::string format;
    double processingTimeMs = 0.0;
    std::string error;
    bool fromCache = false;
};
