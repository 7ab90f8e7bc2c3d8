#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <vector>

#include "geostream/pointcloud/ChunkTaskHandler.h"
#include "geostream/taskpool/task_pool.hpp"

// Control-thread side of point tile requests. Only the most recent request is
// active; starting a new one cancels the previous and any late result of a
// superseded request is dropped by id.
class ChunkDispatcher {
public:
    struct Stats {
        uint64_t submitted = 0;
        uint64_t delivered = 0;
        uint64_t discarded = 0;
        uint64_t failed = 0;
    };

    explicit ChunkDispatcher(taskpool::TaskPool& pool);

    taskpool::TaskId request(ChunkRequest request, ChunkOptions options, taskpool::ProgressCallback onProgress = {});

    std::optional<ChunkResult> poll();
    std::optional<ChunkResult> wait(std::chrono::milliseconds timeout);

    taskpool::TaskId activeTask() const {
        return activeTask_;
    }

    std::size_t inFlightCount() const {
        return inFlight_.size();
    }

    const Stats& stats() const {
        return stats_;
    }

private:
    struct InFlight {
        taskpool::TaskId id = taskpool::kNoTask;
        std::future<taskpool::TaskResult> future;
    };

    std::optional<ChunkResult> collect(InFlight& flight);

    taskpool::TaskPool& pool_;
    std::vector<InFlight> inFlight_;
    taskpool::TaskId activeTask_ = taskpool::kNoTask;
    Stats stats_;
};
