#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "geostream/resources/LoaderTuning.h"
#include "geostream/streaming/AssetSource.h"
#include "geostream/streaming/AssetTaskHandler.h"
#include "geostream/streaming/CancellationToken.h"
#include "geostream/streaming/LoadTypes.h"
#include "geostream/streaming/LodPolicy.h"
#include "geostream/streaming/PerformanceProfile.h"
#include "geostream/taskpool/bounded_channel.hpp"
#include "geostream/taskpool/task_pool.hpp"

// Drives one asset from size probe to renderer-ready geometry:
// sizing -> strategy -> standard | chunked | lod -> complete | failed | cancelled.
//
// Decode passes run on the task pool when one is usable (its workers must run
// AssetTaskHandler), otherwise on a helper thread watched by this one. All
// observer callbacks are made on the thread that called load().
class StreamingLoader {
public:
    struct Config {
        LoaderTuning tuning = kDefaultLoaderTuning;
        PerformanceProfile profile = PerformanceProfile::medium();
    };

    explicit StreamingLoader(taskpool::TaskPool* pool);
    StreamingLoader(taskpool::TaskPool* pool, Config config, std::shared_ptr<const LodPolicy> policy = nullptr);

    LoadOutcome load(AssetSource& source,
                     const LoadObserver& observer = {},
                     std::shared_ptr<const CancellationToken> cancel = nullptr);

    static LoadStrategy selectStrategy(std::optional<uint64_t> size, const LoaderTuning& tuning);

    const Config& config() const {
        return config_;
    }

private:
    struct Session {
        AssetSource& source;
        const LoadObserver& observer;
        std::shared_ptr<const CancellationToken> cancel;
        std::shared_ptr<taskpool::BoundedChannel<ProgressEvent>> progress;
        std::shared_ptr<const AssetBytes> bytes;
        uint64_t sizeBytes = 0;
        LoadOutcome outcome;

        bool cancelled() const {
            return cancel && cancel->cancelled();
        }
    };

    struct PassResult {
        std::optional<GeometryBuffer> buffer;
        std::optional<LoadError> error;
        std::size_t sourceTriangles = 0;
        float appliedFactor = 1.0f;
    };

    struct PreparedLevel {
        SharedGeometry buffer;
        RepairSummary repair;
    };

    void runStandard(Session& session);
    void runChunked(Session& session);
    void runLod(Session& session);

    PassResult runPass(Session& session, float factor, const ProgressEvent& phase, std::chrono::milliseconds timeout);
    PassResult runOnPool(Session& session, const AssetTaskOptions& options, const ProgressEvent& phase,
                         std::chrono::milliseconds timeout);
    PassResult runLocally(Session& session, const AssetTaskOptions& options, const ProgressEvent& phase,
                          std::chrono::milliseconds timeout);
    // Preview pass whose timeout yields the placeholder instead of an error.
    PassResult runPreview(Session& session, float factor, bool& placeholder);
    static PassResult fromDecoded(DecodedAsset&& decoded);

    bool poolUsable() const;
    PreparedLevel prepareLevel(GeometryBuffer&& buffer) const;
    void publishLevel(Session& session, int level, const PreparedLevel& prepared, LevelQuality quality,
                      std::optional<float> switchDistance);
    void emitProgress(Session& session, const ProgressEvent& event);
    void drainProgress(Session& session);
    // Returns false when cancellation arrived during the pause.
    bool yieldBetweenLevels(Session& session);

    void fail(Session& session, LoadErrorKind kind, const std::string& message);
    void markCancelled(Session& session);

    taskpool::TaskPool* pool_;
    Config config_;
    std::shared_ptr<const LodPolicy> policy_;
};
