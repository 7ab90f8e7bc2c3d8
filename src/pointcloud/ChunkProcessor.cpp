#include "geostream/pointcloud/ChunkProcessor.h"

#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

#include "geostream/geometry/DecodeError.h"

namespace {
double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}
}  // namespace

ChunkProcessor::ChunkProcessor() : ChunkProcessor(Config{}) {}

ChunkProcessor::ChunkProcessor(Config config) : config_(config), cache_(config.cacheCapacity) {}

uint64_t ChunkProcessor::contentHash(const uint8_t* data, std::size_t size) {
    uint64_t hash = 14695981039346656037ull;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= 1099511628211ull;
    }
    return hash;
}

std::optional<std::string> ChunkProcessor::cacheKey(const ChunkRequest& request, const ChunkOptions& options) {
    if (options.filter && options.filterKey.empty()) {
        return std::nullopt;
    }

    std::ostringstream key;
    if (!request.chunkId.empty()) {
        key << "id:" << request.chunkId.size() << ':' << request.chunkId;
    } else {
        const uint64_t hash = request.buffer ? contentHash(request.buffer->data(), request.buffer->size())
                                             : contentHash(nullptr, 0);
        key << "fnv:" << std::hex << hash << std::dec << ':' << request.pointCount << ':' << request.recordStride;
    }

    // Caller strings are length-prefixed.
    key << "|filter=" << options.filterKey.size() << ':' << options.filterKey << "|simplify=" << options.simplifyFactor << "|matrix=";
    if (options.transform) {
        key << std::setprecision(9);
        const float* m = &(*options.transform)[0][0];
        for (int i = 0; i < 16; ++i) {
            key << (i == 0 ? "" : ",") << m[i];
        }
    } else {
        key << "none";
    }
    return key.str();
}

ChunkResult ChunkProcessor::process(const ChunkRequest& request,
                                    const ChunkOptions& options,
                                    const ProgressFn& onProgress,
                                    const AbortFn& shouldAbort) {
    const auto start = std::chrono::steady_clock::now();
    const std::optional<std::string> key = cacheKey(request, options);

    if (key) {
        if (std::shared_ptr<const ChunkResult> cached = cache_.find(*key)) {
            ChunkResult hit = *cached;
            hit.fromCache = true;
            hit.processingTimeMs = elapsedMs(start);
            return hit;
        }
    }

    ChunkResult result;
    try {
        result = decodeChunk(request, options, onProgress, shouldAbort);
    } catch (const DecodeAborted&) {
        throw;
    } catch (const std::exception& e) {
        result = ChunkResult{};
        result.success = false;
        result.error = e.what();
        result.recordStride = request.recordStride;
        result.format = request.format;
    }

    result.processingTimeMs = elapsedMs(start);

    if (result.success && key) {
        cache_.insert(*key, std::make_shared<const ChunkResult>(result));
    }
    return result;
}

void ChunkProcessor::clearCache() {
    cache_.clear();
}

ChunkResult ChunkProcessor::decodeChunk(const ChunkRequest& request,
                                        const ChunkOptions& options,
                                        const ProgressFn& onProgress,
                                        const AbortFn& shouldAbort) const {
    if (!request.buffer) {
        throw DecodeError("chunk has no buffer");
    }
    if (options.simplifyFactor == 0) {
        throw DecodeError("simplify factor must be at least 1");
    }

    const AttributeLayout layout = AttributeLayout::resolve(request.attributes, request.recordStride);
    const std::size_t stride = request.recordStride;
    const std::size_t required = static_cast<std::size_t>(request.pointCount) * stride;
    if (request.buffer->size() < required) {
        throw DecodeError("chunk buffer holds " + std::to_string(request.buffer->size()) + " bytes, expected " +
                          std::to_string(required));
    }

    const uint32_t k = options.simplifyFactor;
    const std::size_t capacity = (static_cast<std::size_t>(request.pointCount) + k - 1) / k;
    std::vector<uint8_t> out(capacity * stride);

    const glm::mat4* transform = options.transform ? &*options.transform : nullptr;
    const glm::mat3 rotation = transform ? glm::mat3(*transform) : glm::mat3(1.0f);

    const uint8_t* source = request.buffer->data();
    const std::size_t progressInterval = config_.progressInterval == 0 ? 1 : config_.progressInterval;
    const std::size_t abortInterval = config_.abortCheckInterval == 0 ? 1 : config_.abortCheckInterval;

    DecodedPoint point;
    std::size_t kept = 0;

    for (std::size_t i = 0; i < request.pointCount; ++i) {
        if (i % abortInterval == 0 && shouldAbort && shouldAbort()) {
            throw DecodeAborted();
        }
        if (i % progressInterval == 0 && onProgress) {
            onProgress(static_cast<float>(i) / static_cast<float>(request.pointCount));
        }
        if (i % k != 0) {
            continue;
        }

        const uint8_t* record = source + i * stride;
        layout.decode(record, point);

        if (options.filter && !options.filter(point)) {
            continue;
        }

        uint8_t* dst = out.data() + kept * stride;
        std::memcpy(dst, record, stride);

        if (transform) {
            if (point.hasPosition) {
                const glm::vec4 moved = *transform * glm::vec4(point.position, 1.0f);
                layout.encodePosition(dst, glm::vec3(moved));
            }
            if (point.hasNormal) {
                glm::vec3 normal = rotation * point.normal;
                const float length = glm::length(normal);
                if (length > 0.0f) {
                    normal /= length;
                }
                layout.encodeNormal(dst, normal);
            }
        }
        ++kept;
    }

    out.resize(kept * stride);

    ChunkResult result;
    result.success = true;
    result.buffer = std::make_shared<const ChunkBytes>(std::move(out));
    result.pointCount = static_cast<uint32_t>(kept);
    result.recordStride = request.recordStride;
    result.format = request.format;
    return result;
}
