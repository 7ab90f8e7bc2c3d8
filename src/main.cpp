#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "geostream/resources/LoaderTuning.h"
#include "geostream/streaming/AssetSource.h"
#include "geostream/streaming/AssetTaskHandler.h"
#include "geostream/streaming/StreamingLoader.h"
#include "geostream/taskpool/task_pool.hpp"

namespace {
void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <model.obj> [--config tuning.json] [--profile high|medium|low] [--workers N] [--no-pool]"
              << " [--decimate FACTOR]" << std::endl;
}

struct Arguments {
    std::string path;
    std::string configPath;
    std::string profileName = "medium";
    std::size_t workers = 0;
    bool usePool = true;
    std::optional<float> decimate;
};

bool parseArguments(int argc, char** argv, Arguments& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "geostream_load: " << flag << " needs a value." << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--config") {
            const char* value = next("--config");
            if (value == nullptr) {
                return false;
            }
            out.configPath = value;
        } else if (arg == "--profile") {
            const char* value = next("--profile");
            if (value == nullptr) {
                return false;
            }
            out.profileName = value;
        } else if (arg == "--workers") {
            const char* value = next("--workers");
            if (value == nullptr) {
                return false;
            }
            out.workers = static_cast<std::size_t>(std::strtoul(value, nullptr, 10));
        } else if (arg == "--no-pool") {
            out.usePool = false;
        } else if (arg == "--decimate") {
            const char* value = next("--decimate");
            if (value == nullptr) {
                return false;
            }
            out.decimate = std::strtof(value, nullptr);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "geostream_load: unknown option '" << arg << "'." << std::endl;
            return false;
        } else if (out.path.empty()) {
            out.path = arg;
        } else {
            std::cerr << "geostream_load: unexpected argument '" << arg << "'." << std::endl;
            return false;
        }
    }
    return !out.path.empty();
}

// Re-decimates the loaded model through the pool as a Decimate task.
void runDecimate(taskpool::TaskPool& pool, const SharedGeometry& model, float factor) {
    AssetTaskOptions options;
    options.decimationFactor = factor;
    options.source = model;

    taskpool::TaskPayload payload;
    payload.options = options;

    taskpool::SubmittedTask task = pool.submit(taskpool::TaskKind::Decimate, std::move(payload));
    try {
        taskpool::TaskResult result = task.result.get();
        const auto decimated = std::any_cast<DecodedAsset>(std::move(result.value));
        std::cout << "decimate " << factor << " (applied " << decimated.appliedFactor << "): " << model->triangleCount()
                  << " -> " << decimated.geometry.triangleCount() << " triangles in " << result.processing_time_ms
                  << " ms" << std::endl;
    } catch (const taskpool::TaskError& e) {
        std::cerr << "geostream_load: decimate task failed (" << taskpool::to_string(e.code()) << "): " << e.what()
                  << std::endl;
    }
}
}  // namespace

int main(int argc, char** argv) {
    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(argv[0]);
        return 2;
    }

    StreamingLoader::Config config;
    if (!args.configPath.empty() && !loadLoaderTuning(args.configPath, config.tuning)) {
        return 2;
    }

    const std::optional<PerformanceProfile> profile = performanceProfileByName(args.profileName);
    if (!profile) {
        std::cerr << "geostream_load: unknown profile '" << args.profileName << "'." << std::endl;
        return 2;
    }
    config.profile = *profile;
    config.profile.useWorkerPool = args.usePool;

    taskpool::TaskPool::Config poolConfig;
    poolConfig.max_workers = args.workers;
    taskpool::TaskPool pool(makeAssetHandlerFactory(), poolConfig);

    StreamingLoader loader(&pool, config);
    FileAssetSource source(args.path);

    LoadObserver observer;
    observer.onProgress = [](const ProgressEvent& event) {
        std::cout << "  [" << event.label() << "] " << std::fixed << std::setprecision(1)
                  << event.progress * 100.0f << "%" << std::endl;
    };
    observer.onLevelReady = [](const LevelReadyEvent& event) {
        std::cout << "level " << event.level << " ready: " << toString(event.quality) << ", "
                  << event.triangleCount << " triangles";
        if (event.switchDistance) {
            std::cout << ", switch distance " << *event.switchDistance;
        }
        std::cout << std::endl;
    };

    const LoadOutcome outcome = loader.load(source, observer);

    if (!outcome.ok()) {
        const LoadErrorKind kind = outcome.error ? outcome.error->kind : LoadErrorKind::Internal;
        std::cerr << "geostream_load: " << userMessageFor(kind) << std::endl;
        if (outcome.error) {
            std::cerr << "  (" << toString(kind) << ": " << outcome.error->message << ")" << std::endl;
        }
        return outcome.status == LoadStatus::Cancelled ? 130 : 1;
    }

    std::cout << "loaded " << args.path << " via " << toString(outcome.strategy) << " strategy: "
              << outcome.stats.triangles << " triangles, " << outcome.stats.vertices << " vertices, "
              << outcome.stats.lodLevels << " LOD levels, " << std::setprecision(1) << outcome.stats.loadTimeMs
              << " ms" << std::endl;
    std::cout << "bounding sphere radius " << outcome.repair.boundingSphere.radius
              << (outcome.repair.usedFallbackSphere ? " (fallback)" : "") << ", " << outcome.repair.fixedCount
              << " coordinates repaired, " << outcome.repair.degenerateTriangles << " degenerate triangles"
              << std::endl;
    for (const std::string& warning : outcome.warnings) {
        std::cout << "warning: " << warning << std::endl;
    }

    if (args.decimate && pool.available()) {
        runDecimate(pool, outcome.model, *args.decimate);
    }

    const taskpool::PoolMetrics metrics = pool.metrics();
    std::cout << "pool: " << metrics.tasks_processed << " tasks, avg " << metrics.avg_processing_time_ms
              << " ms, peak queue " << metrics.peak_queue_length << ", " << metrics.total_workers << " workers"
              << std::endl;

    pool.dispose();
    return 0;
}
