#pragma once

#include <any>

#include "geostream/pointcloud/ChunkProcessor.h"
#include "geostream/taskpool/task_pool.hpp"

// Options carried in TaskPayload::options for TransformChunk tasks. The
// record bytes travel in TaskPayload::bytes.
struct ChunkTaskInput {
    ChunkRequest request;
    ChunkOptions options;
};

class ChunkTaskHandler : public taskpool::TaskHandler {
public:
    ChunkTaskHandler() = default;
    explicit ChunkTaskHandler(ChunkProcessor::Config config) : processor_(config) {}

    // Returns a ChunkResult.
    std::any handle(const taskpool::Task& task, taskpool::WorkerContext& ctx) override;
    void clear_cache() override;

    const ChunkProcessor& processor() const {
        return processor_;
    }

private:
    ChunkProcessor processor_;
};

taskpool::HandlerFactory makeChunkHandlerFactory(ChunkProcessor::Config config = {});
