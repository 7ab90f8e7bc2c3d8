#include "geostream/pointcloud/ChunkTaskHandler.h"

#include <memory>
#include <stdexcept>
#include <string>

#include "geostream/geometry/DecodeError.h"

std::any ChunkTaskHandler::handle(const taskpool::Task& task, taskpool::WorkerContext& ctx) {
    if (task.kind != taskpool::TaskKind::TransformChunk) {
        throw std::invalid_argument(std::string("chunk worker cannot run ") + taskpool::to_string(task.kind) + " tasks");
    }

    const auto* input = std::any_cast<ChunkTaskInput>(&task.payload.options);
    if (input == nullptr) {
        throw std::invalid_argument("transform-chunk task is missing its ChunkTaskInput");
    }

    ChunkRequest request = input->request;
    if (task.payload.bytes) {
        request.buffer = task.payload.bytes;
    }

    try {
        return processor_.process(
            request,
            input->options,
            [&ctx](float progress) { ctx.report_progress(progress); },
            [&ctx]() { return ctx.cancel_requested(); });
    } catch (const DecodeAborted&) {
        throw taskpool::TaskCancelled();
    }
}

void ChunkTaskHandler::clear_cache() {
    processor_.clearCache();
}

taskpool::HandlerFactory makeChunkHandlerFactory(ChunkProcessor::Config config) {
    return [config](std::size_t) -> std::unique_ptr<taskpool::TaskHandler> {
        return std::make_unique<ChunkTaskHandler>(config);
    };
}
