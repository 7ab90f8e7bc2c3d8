#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

// Capability budget supplied by the platform layer. The loader reads it and
// never re-detects capabilities itself.
struct PerformanceProfile {
    uint32_t maxTriangles = 1'000'000;
    uint32_t chunkSize = 500'000;
    int lodLevels = 3;
    bool useWorkerPool = true;

    static constexpr PerformanceProfile high() {
        return PerformanceProfile{2'000'000, 1'000'000, 4, true};
    }

    static constexpr PerformanceProfile medium() {
        return PerformanceProfile{1'000'000, 500'000, 3, true};
    }

    static constexpr PerformanceProfile low() {
        return PerformanceProfile{500'000, 250'000, 2, true};
    }
};

std::optional<PerformanceProfile> performanceProfileByName(std::string_view name);
