#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

// Payload size bands and budgets of the streaming loader. The byte thresholds
// are heuristics, not format limits.
struct LoaderTuning {
    // Below this size a load is a single full-resolution pass.
    uint64_t standardMaxBytes = 5ull * 1024ull * 1024ull;
    // Below this size (and at or above standardMaxBytes) a load is preview + medium.
    uint64_t chunkedMaxBytes = 30ull * 1024ull * 1024ull;
    // Above this size the LOD table switches to its conservative band.
    uint64_t conservativeLodBytes = 100ull * 1024ull * 1024ull;

    float chunkedPreviewFactor = 0.05f;
    float chunkedMediumFactor = 0.3f;
    float lodPreviewFactor = 0.02f;

    uint32_t decodeTimeoutMs = 60'000;
    uint32_t previewTimeoutMs = 10'000;
    // Cooperative pause between LOD levels.
    uint32_t levelYieldMs = 100;
    uint32_t taskPollMs = 10;

    std::size_t progressChannelCapacity = 64;
};

inline constexpr LoaderTuning kDefaultLoaderTuning{};

// Keys absent from the document keep the value already in outTuning.
bool loadLoaderTuning(const std::filesystem::path& path, LoaderTuning& outTuning);
bool parseLoaderTuning(const std::string& text, LoaderTuning& outTuning);
