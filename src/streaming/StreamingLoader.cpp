#include "geostream/streaming/StreamingLoader.h"

#include <atomic>
#include <future>
#include <iostream>
#include <new>
#include <system_error>
#include <thread>
#include <utility>

#include "geostream/geometry/Decimator.h"

namespace {
using Clock = std::chrono::steady_clock;

LoadErrorKind kindForTaskError(taskpool::TaskErrorCode code) {
    switch (code) {
        case taskpool::TaskErrorCode::Cancelled:
            return LoadErrorKind::Cancelled;
        case taskpool::TaskErrorCode::Disposed:
        case taskpool::TaskErrorCode::WorkerUnavailable:
            return LoadErrorKind::WorkerUnavailable;
        case taskpool::TaskErrorCode::ResourceExhausted:
            return LoadErrorKind::ResourceExhausted;
        case taskpool::TaskErrorCode::Failed:
            return LoadErrorKind::DecodeError;
    }
    return LoadErrorKind::Internal;
}

LoadError makeError(LoadErrorKind kind, std::string message) {
    return LoadError{kind, std::move(message)};
}
}  // namespace

StreamingLoader::StreamingLoader(taskpool::TaskPool* pool) : StreamingLoader(pool, Config{}) {}

StreamingLoader::StreamingLoader(taskpool::TaskPool* pool, Config config, std::shared_ptr<const LodPolicy> policy)
    : pool_(pool), config_(config), policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = std::make_shared<DefaultLodPolicy>(config_.tuning);
    }
    if (config_.tuning.taskPollMs == 0) {
        config_.tuning.taskPollMs = 1;
    }
}

LoadStrategy StreamingLoader::selectStrategy(std::optional<uint64_t> size, const LoaderTuning& tuning) {
    if (!size || *size < tuning.standardMaxBytes) {
        return LoadStrategy::Standard;
    }
    if (*size < tuning.chunkedMaxBytes) {
        return LoadStrategy::Chunked;
    }
    return LoadStrategy::Lod;
}

LoadOutcome StreamingLoader::load(AssetSource& source,
                                  const LoadObserver& observer,
                                  std::shared_ptr<const CancellationToken> cancel) {
    const auto start = Clock::now();
    Session session{source,
                    observer,
                    std::move(cancel),
                    std::make_shared<taskpool::BoundedChannel<ProgressEvent>>(config_.tuning.progressChannelCapacity)};

    auto finish = [&session, start]() {
        LoadOutcome& outcome = session.outcome;
        if (outcome.ok() && outcome.model) {
            outcome.stats.triangles = outcome.model->triangleCount();
            outcome.stats.vertices = outcome.model->vertexCount();
        }
        outcome.stats.loadTimeMs = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        return std::move(session.outcome);
    };

    if (session.cancelled()) {
        markCancelled(session);
        return finish();
    }

    std::optional<uint64_t> size;
    try {
        size = source.probeSize();
    } catch (const std::exception& e) {
        fail(session, LoadErrorKind::Internal, std::string("size probe failed: ") + e.what());
        return finish();
    }

    session.sizeBytes = size.value_or(0);
    session.outcome.stats.fileSize = size;
    session.outcome.strategy = selectStrategy(size, config_.tuning);

    std::cout << "StreamingLoader: " << source.describe() << " ("
              << (size ? std::to_string(*size) + " bytes" : std::string("unknown size")) << ") -> "
              << toString(session.outcome.strategy) << " strategy" << std::endl;

    if (session.cancelled()) {
        markCancelled(session);
        return finish();
    }

    try {
        session.bytes = source.fetch([this, &session](float progress) {
            emitProgress(session, ProgressEvent{LoadPhase::Downloading, progress, std::nullopt});
        });
    } catch (const std::bad_alloc&) {
        fail(session, LoadErrorKind::ResourceExhausted, "out of memory while reading " + source.describe());
        return finish();
    } catch (const std::exception& e) {
        fail(session, LoadErrorKind::Internal, std::string("reading source failed: ") + e.what());
        return finish();
    }

    if (!session.bytes) {
        fail(session, LoadErrorKind::Internal, "source delivered no data");
        return finish();
    }
    if (session.cancelled()) {
        markCancelled(session);
        return finish();
    }

    switch (session.outcome.strategy) {
        case LoadStrategy::Standard:
            runStandard(session);
            break;
        case LoadStrategy::Chunked:
            runChunked(session);
            break;
        case LoadStrategy::Lod:
            runLod(session);
            break;
    }

    return finish();
}

void StreamingLoader::runStandard(Session& session) {
    PassResult pass = runPass(session,
                              1.0f,
                              ProgressEvent{LoadPhase::Parsing, 0.0f, std::nullopt},
                              std::chrono::milliseconds(config_.tuning.decodeTimeoutMs));
    if (pass.error) {
        if (pass.error->kind == LoadErrorKind::Cancelled) {
            markCancelled(session);
        } else {
            fail(session, pass.error->kind, "decode failed: " + pass.error->message);
        }
        return;
    }
    if (session.cancelled()) {
        markCancelled(session);
        return;
    }

    publishLevel(session, 0, prepareLevel(std::move(*pass.buffer)), LevelQuality::Full, std::nullopt);
    session.outcome.status = LoadStatus::Complete;
}

void StreamingLoader::runChunked(Session& session) {
    bool placeholder = false;
    PassResult preview = runPreview(session, config_.tuning.chunkedPreviewFactor, placeholder);
    if (preview.error) {
        if (preview.error->kind == LoadErrorKind::Cancelled) {
            markCancelled(session);
        } else {
            fail(session, preview.error->kind, "preview failed: " + preview.error->message);
        }
        return;
    }

    publishLevel(session,
                 0,
                 prepareLevel(std::move(*preview.buffer)),
                 placeholder ? LevelQuality::Placeholder : LevelQuality::Preview,
                 std::nullopt);

    if (session.cancelled()) {
        markCancelled(session);
        return;
    }

    PassResult medium = runPass(session,
                                config_.tuning.chunkedMediumFactor,
                                ProgressEvent{LoadPhase::MediumQuality, 0.0f, std::nullopt},
                                std::chrono::milliseconds(config_.tuning.decodeTimeoutMs));
    if (medium.error) {
        if (medium.error->kind == LoadErrorKind::Cancelled) {
            markCancelled(session);
            return;
        }
        std::cerr << "StreamingLoader: medium-quality pass failed, keeping preview: " << medium.error->message
                  << std::endl;
        session.outcome.warnings.push_back("medium-quality pass failed: " + medium.error->message);
        session.outcome.status = LoadStatus::Complete;
        return;
    }

    publishLevel(session, 1, prepareLevel(std::move(*medium.buffer)), LevelQuality::Medium, std::nullopt);
    session.outcome.status = LoadStatus::Complete;
}

void StreamingLoader::runLod(Session& session) {
    const LodStep first = policy_->preview(session.sizeBytes);

    bool placeholder = false;
    PassResult preview = runPreview(session, first.decimationFactor, placeholder);
    if (preview.error) {
        if (preview.error->kind == LoadErrorKind::Cancelled) {
            markCancelled(session);
        } else {
            fail(session, preview.error->kind, "preview failed: " + preview.error->message);
        }
        return;
    }

    LodAssembler assembler;
    const PreparedLevel coarse = prepareLevel(std::move(*preview.buffer));
    const float previewFactor = placeholder ? first.decimationFactor : preview.appliedFactor;
    if (!assembler.addLevel(coarse.buffer, first.switchDistance, previewFactor)) {
        fail(session, LoadErrorKind::Internal, "LOD policy produced an invalid preview level");
        return;
    }
    publishLevel(session,
                 0,
                 coarse,
                 placeholder ? LevelQuality::Placeholder : LevelQuality::Preview,
                 first.switchDistance);

    // Unknown after a placeholder preview until a refinement decodes.
    std::size_t sourceTriangles = placeholder ? 0 : preview.sourceTriangles;
    std::size_t previousTriangles = coarse.buffer->triangleCount();

    const std::vector<LodStep> steps = policy_->refinements(session.sizeBytes, config_.profile.lodLevels);
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const int level = static_cast<int>(i) + 1;
        if (!yieldBetweenLevels(session)) {
            markCancelled(session);
            return;
        }

        // Once the triangle cap binds, finer levels decode to the same count.
        if (sourceTriangles > 0) {
            const float capped =
                cappedDecimationFactor(sourceTriangles, steps[i].decimationFactor, config_.profile.maxTriangles);
            if (Decimator::keptTriangleCount(sourceTriangles, capped) <= previousTriangles) {
                std::cout << "StreamingLoader: triangle cap " << config_.profile.maxTriangles << " reached, stopping at "
                          << assembler.levelCount() << " LOD level(s)" << std::endl;
                break;
            }
        }

        PassResult pass = runPass(session,
                                  steps[i].decimationFactor,
                                  ProgressEvent{LoadPhase::Lod, 0.0f, level},
                                  std::chrono::milliseconds(config_.tuning.decodeTimeoutMs));
        if (pass.error) {
            if (pass.error->kind == LoadErrorKind::Cancelled) {
                markCancelled(session);
                return;
            }
            std::cerr << "StreamingLoader: LOD level " << level << " failed, keeping " << assembler.levelCount()
                      << " level(s): " << pass.error->message << std::endl;
            session.outcome.warnings.push_back("LOD level " + std::to_string(level) +
                                               " failed: " + pass.error->message);
            break;
        }
        sourceTriangles = pass.sourceTriangles;

        const PreparedLevel prepared = prepareLevel(std::move(*pass.buffer));
        if (prepared.buffer->triangleCount() <= previousTriangles) {
            std::cout << "StreamingLoader: LOD level " << level << " adds no triangles, stopping at "
                      << assembler.levelCount() << " level(s)" << std::endl;
            break;
        }
        if (!assembler.addLevel(prepared.buffer, steps[i].switchDistance, pass.appliedFactor)) {
            session.outcome.warnings.push_back("LOD level " + std::to_string(level) + " rejected by assembler");
            break;
        }
        previousTriangles = prepared.buffer->triangleCount();
        publishLevel(session, level, prepared, LevelQuality::Lod, steps[i].switchDistance);
    }

    session.outcome.stats.lodLevels = assembler.levelCount();
    session.outcome.lod = std::move(assembler);
    session.outcome.status = LoadStatus::Complete;
}

StreamingLoader::PassResult StreamingLoader::runPass(Session& session,
                                                     float factor,
                                                     const ProgressEvent& phase,
                                                     std::chrono::milliseconds timeout) {
    if (session.cancelled()) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::Cancelled, "load cancelled")};
    }

    emitProgress(session, phase);

    AssetTaskOptions options;
    options.decimationFactor = factor;
    options.maxTriangles = config_.profile.maxTriangles;

    if (poolUsable()) {
        PassResult result = runOnPool(session, options, phase, timeout);
        if (!result.error || result.error->kind != LoadErrorKind::WorkerUnavailable) {
            return result;
        }
        std::cerr << "StreamingLoader: worker pool unavailable (" << result.error->message
                  << "), decoding outside the pool." << std::endl;
        session.outcome.warnings.push_back("worker pool unavailable: " + result.error->message);
    }

    return runLocally(session, options, phase, timeout);
}

StreamingLoader::PassResult StreamingLoader::runOnPool(Session& session,
                                                       const AssetTaskOptions& options,
                                                       const ProgressEvent& phase,
                                                       std::chrono::milliseconds timeout) {
    taskpool::TaskPayload payload;
    payload.bytes = session.bytes;
    payload.options = options;

    // The source bytes are immutable and shared, so the worker borrows them.
    taskpool::SubmitOptions submitOptions;
    submitOptions.transfer_ownership = true;
    submitOptions.on_progress = [channel = session.progress, phase](const taskpool::ProgressUpdate& update) {
        ProgressEvent event = phase;
        event.progress = update.progress;
        channel->push(event);
    };

    taskpool::SubmittedTask task;
    try {
        task = pool_->submit(taskpool::TaskKind::Parse, std::move(payload), std::move(submitOptions));
    } catch (const std::exception& e) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::WorkerUnavailable, e.what())};
    }

    const auto deadline = Clock::now() + timeout;
    const std::chrono::milliseconds poll(config_.tuning.taskPollMs);

    while (task.result.wait_for(poll) != std::future_status::ready) {
        drainProgress(session);
        if (session.cancelled()) {
            pool_->cancel(task.id);
            return PassResult{std::nullopt, makeError(LoadErrorKind::Cancelled, "load cancelled")};
        }
        if (Clock::now() >= deadline) {
            pool_->cancel(task.id);
            return PassResult{std::nullopt,
                              makeError(LoadErrorKind::Timeout,
                                        "decode exceeded " + std::to_string(timeout.count()) + " ms")};
        }
    }
    drainProgress(session);

    try {
        taskpool::TaskResult result = task.result.get();
        return fromDecoded(std::any_cast<DecodedAsset>(std::move(result.value)));
    } catch (const taskpool::TaskError& e) {
        return PassResult{std::nullopt, makeError(kindForTaskError(e.code()), e.what())};
    } catch (const std::bad_any_cast&) {
        return PassResult{std::nullopt,
                          makeError(LoadErrorKind::Internal, "pool worker returned no geometry; is it running "
                                                             "AssetTaskHandler?")};
    }
}

StreamingLoader::PassResult StreamingLoader::runLocally(Session& session,
                                                        const AssetTaskOptions& options,
                                                        const ProgressEvent& phase,
                                                        std::chrono::milliseconds timeout) {
    auto abort = std::make_shared<std::atomic<bool>>(false);

    std::future<DecodedAsset> decoded;
    try {
        decoded = std::async(std::launch::async,
                             [bytes = session.bytes, options, abort, channel = session.progress, phase]() {
                                 DecodeCallbacks callbacks;
                                 callbacks.onProgress = [&channel, &phase](float progress) {
                                     ProgressEvent event = phase;
                                     event.progress = progress;
                                     channel->push(event);
                                 };
                                 callbacks.shouldAbort = [&abort]() {
                                     return abort->load(std::memory_order_acquire);
                                 };
                                 return decodeAsset(*bytes, options, callbacks);
                             });
    } catch (const std::system_error& e) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::WorkerUnavailable, e.what())};
    }

    const auto deadline = Clock::now() + timeout;
    const std::chrono::milliseconds poll(config_.tuning.taskPollMs);

    while (decoded.wait_for(poll) != std::future_status::ready) {
        drainProgress(session);
        if (session.cancelled() || Clock::now() >= deadline) {
            const bool cancelled = session.cancelled();
            abort->store(true, std::memory_order_release);
            decoded.wait();
            if (cancelled) {
                return PassResult{std::nullopt, makeError(LoadErrorKind::Cancelled, "load cancelled")};
            }
            return PassResult{std::nullopt,
                              makeError(LoadErrorKind::Timeout,
                                        "decode exceeded " + std::to_string(timeout.count()) + " ms")};
        }
    }
    drainProgress(session);

    try {
        return fromDecoded(decoded.get());
    } catch (const DecodeAborted&) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::Cancelled, "decode aborted")};
    } catch (const DecodeError& e) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::DecodeError, e.what())};
    } catch (const std::bad_alloc&) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::ResourceExhausted, "out of memory while decoding")};
    } catch (const std::exception& e) {
        return PassResult{std::nullopt, makeError(LoadErrorKind::Internal, e.what())};
    }
}

StreamingLoader::PassResult StreamingLoader::runPreview(Session& session, float factor, bool& placeholder) {
    placeholder = false;
    PassResult result = runPass(session,
                                factor,
                                ProgressEvent{LoadPhase::Preview, 0.0f, std::nullopt},
                                std::chrono::milliseconds(config_.tuning.previewTimeoutMs));

    if (result.error && result.error->kind == LoadErrorKind::Timeout) {
        std::cerr << "StreamingLoader: preview timed out, substituting placeholder." << std::endl;
        session.outcome.warnings.push_back("preview timed out: " + result.error->message);
        result.error.reset();
        result.buffer = makePlaceholderCube();
        placeholder = true;
    }
    return result;
}

StreamingLoader::PassResult StreamingLoader::fromDecoded(DecodedAsset&& decoded) {
    PassResult result;
    result.buffer = std::move(decoded.geometry);
    result.sourceTriangles = decoded.sourceTriangles;
    result.appliedFactor = decoded.appliedFactor;
    return result;
}

bool StreamingLoader::poolUsable() const {
    return pool_ != nullptr && config_.profile.useWorkerPool && pool_->available();
}

StreamingLoader::PreparedLevel StreamingLoader::prepareLevel(GeometryBuffer&& buffer) const {
    RepairResult repaired = GeometryRepair::repair(std::move(buffer));

    PreparedLevel prepared;
    prepared.repair.fixedCount = repaired.fixedCount;
    prepared.repair.degenerateTriangles = repaired.degenerateTriangles;
    prepared.repair.boundingSphere = repaired.boundingSphere;
    prepared.repair.usedFallbackSphere = repaired.usedFallbackSphere;
    prepared.repair.issues = std::move(repaired.issues);
    prepared.buffer = freezeGeometry(std::move(repaired.buffer));
    return prepared;
}

void StreamingLoader::publishLevel(Session& session,
                                   int level,
                                   const PreparedLevel& prepared,
                                   LevelQuality quality,
                                   std::optional<float> switchDistance) {
    drainProgress(session);

    session.outcome.model = prepared.buffer;
    session.outcome.repair = prepared.repair;
    ++session.outcome.stats.levelEvents;

    if (!session.observer.onLevelReady) {
        return;
    }

    LevelReadyEvent event;
    event.level = level;
    event.buffer = prepared.buffer;
    event.quality = quality;
    event.triangleCount = prepared.buffer->triangleCount();
    event.switchDistance = switchDistance;

    try {
        session.observer.onLevelReady(event);
    } catch (const std::exception& e) {
        std::cerr << "StreamingLoader: level-ready observer threw: " << e.what() << std::endl;
    }
}

void StreamingLoader::emitProgress(Session& session, const ProgressEvent& event) {
    if (!session.observer.onProgress) {
        return;
    }
    try {
        session.observer.onProgress(event);
    } catch (const std::exception& e) {
        std::cerr << "StreamingLoader: progress observer threw: " << e.what() << std::endl;
    }
}

void StreamingLoader::drainProgress(Session& session) {
    for (const ProgressEvent& event : session.progress->drain()) {
        emitProgress(session, event);
    }
}

bool StreamingLoader::yieldBetweenLevels(Session& session) {
    drainProgress(session);
    const std::chrono::milliseconds pause(config_.tuning.levelYieldMs);

    if (session.cancel) {
        if (pause.count() > 0 && session.cancel->waitFor(pause)) {
            return false;
        }
        return !session.cancel->cancelled();
    }
    if (pause.count() > 0) {
        std::this_thread::sleep_for(pause);
    }
    return true;
}

void StreamingLoader::fail(Session& session, LoadErrorKind kind, const std::string& message) {
    std::cerr << "StreamingLoader: load of " << session.source.describe() << " failed (" << toString(kind)
              << "): " << message << std::endl;
    session.outcome.status = LoadStatus::Failed;
    session.outcome.error = makeError(kind, message);
    session.outcome.model.reset();
    session.outcome.lod.reset();
    session.outcome.stats.lodLevels = 0;
}

void StreamingLoader::markCancelled(Session& session) {
    std::cout << "StreamingLoader: load of " << session.source.describe() << " cancelled." << std::endl;
    session.outcome.status = LoadStatus::Cancelled;
    session.outcome.error = makeError(LoadErrorKind::Cancelled, "load cancelled");
    session.outcome.model.reset();
    session.outcome.lod.reset();
    session.outcome.stats.lodLevels = 0;
}
