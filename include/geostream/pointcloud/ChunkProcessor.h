#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "geostream/pointcloud/ChunkCache.h"
#include "geostream/pointcloud/ChunkTypes.h"

// Decodes one binary point chunk, applies filter / stride simplification /
// affine transform and re-encodes the kept records with the input layout.
// Not thread-safe: each worker owns its own processor and cache.
class ChunkProcessor {
public:
    struct Config {
        std::size_t cacheCapacity = ChunkCache::kDefaultCapacity;
        std::size_t progressInterval = 10'000;
        std::size_t abortCheckInterval = 1'024;
    };

    using ProgressFn = std::function<void(float)>;
    using AbortFn = std::function<bool()>;

    ChunkProcessor();
    explicit ChunkProcessor(Config config);

    // Decode failures are reported through ChunkResult::success. Only an abort
    // request escapes, as DecodeAborted.
    ChunkResult process(const ChunkRequest& request,
                        const ChunkOptions& options,
                        const ProgressFn& onProgress = {},
                        const AbortFn& shouldAbort = {});

    void clearCache();

    const ChunkCache& cache() const {
        return cache_;
    }

    static std::optional<std::string> cacheKey(const ChunkRequest& request, const ChunkOptions& options);
    static uint64_t contentHash(const uint8_t* data, std::size_t size);

private:
    ChunkResult decodeChunk(const ChunkRequest& request,
                            const ChunkOptions& options,
                            const ProgressFn& onProgress,
                            const AbortFn& shouldAbort) const;

    Config config_;
    ChunkCache cache_;
};
