#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "geostream/geometry/GeometryBuffer.h"
#include "geostream/geometry/GeometryRepair.h"
#include "geostream/streaming/LodAssembler.h"

enum class LoadStrategy : uint8_t {
    Standard = 0,
    Chunked,
    Lod,
};

enum class LoadPhase : uint8_t {
    Downloading = 0,
    Parsing,
    Preview,
    Lod,
    MediumQuality,
};

enum class LevelQuality : uint8_t {
    Placeholder = 0,
    Preview,
    Medium,
    Lod,
    Full,
};

enum class LoadStatus : uint8_t {
    Complete = 0,
    Failed,
    Cancelled,
};

enum class LoadErrorKind : uint8_t {
    Cancelled = 0,
    Timeout,
    DecodeError,
    ResourceExhausted,
    WorkerUnavailable,
    Internal,
};

const char* toString(LoadStrategy strategy);
const char* toString(LevelQuality quality);
const char* toString(LoadStatus status);
const char* toString(LoadErrorKind kind);
std::string userMessageFor(LoadErrorKind kind);

struct ProgressEvent {
    LoadPhase phase = LoadPhase::Parsing;
    float progress = 0.0f;
    std::optional<int> level;

    // "downloading", "parsing", "preview", "lod-N" or "medium-quality".
    std::string label() const;
};

struct LevelReadyEvent {
    int level = 0;
    SharedGeometry buffer;
    LevelQuality quality = LevelQuality::Full;
    std::size_t triangleCount = 0;
    std::optional<float> switchDistance;
};

struct LoadObserver {
    std::function<void(const ProgressEvent&)> onProgress;
    std::function<void(const LevelReadyEvent&)> onLevelReady;
};

struct LoadError {
    LoadErrorKind kind = LoadErrorKind::Internal;
    std::string message;

    std::string userMessage() const {
        return userMessageFor(kind);
    }
};

struct LoadStats {
    std::size_t triangles = 0;
    std::size_t vertices = 0;
    std::optional<uint64_t> fileSize;
    double loadTimeMs = 0.0;
    std::size_t lodLevels = 0;
    std::size_t levelEvents = 0;
};

struct RepairSummary {
    std::size_t fixedCount = 0;
    std::size_t degenerateTriangles = 0;
    BoundingSphere boundingSphere;
    bool usedFallbackSphere = false;
    std::vector<std::string> issues;
};

struct LoadOutcome {
    LoadStatus status = LoadStatus::Failed;
    LoadStrategy strategy = LoadStrategy::Standard;
    // Best model produced; null unless the load completed.
    SharedGeometry model;
    std::optional<LodAssembler> lod;
    LoadStats stats;
    RepairSummary repair;
    std::optional<LoadError> error;
    std::vector<std::string> warnings;

    bool ok() const {
        return status == LoadStatus::Complete;
    }
};
