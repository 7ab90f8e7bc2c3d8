#include "geostream/pointcloud/ChunkDispatcher.h"

#include <iostream>
#include <utility>

ChunkDispatcher::ChunkDispatcher(taskpool::TaskPool& pool) : pool_(pool) {}

taskpool::TaskId ChunkDispatcher::request(ChunkRequest request, ChunkOptions options,
                                          taskpool::ProgressCallback onProgress) {
    if (activeTask_ != taskpool::kNoTask) {
        pool_.cancel(activeTask_);
    }

    taskpool::TaskPayload payload;
    payload.bytes = std::move(request.buffer);
    request.buffer.reset();
    payload.options = ChunkTaskInput{std::move(request), std::move(options)};

    taskpool::SubmitOptions submitOptions;
    submitOptions.transfer_ownership = true;
    submitOptions.on_progress = std::move(onProgress);

    taskpool::SubmittedTask submitted =
        pool_.submit(taskpool::TaskKind::TransformChunk, std::move(payload), std::move(submitOptions));

    activeTask_ = submitted.id;
    inFlight_.push_back(InFlight{submitted.id, std::move(submitted.result)});
    ++stats_.submitted;
    return activeTask_;
}

std::optional<ChunkResult> ChunkDispatcher::poll() {
    std::optional<ChunkResult> delivered;

    for (auto it = inFlight_.begin(); it != inFlight_.end();) {
        if (it->future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        std::optional<ChunkResult> result = collect(*it);
        it = inFlight_.erase(it);
        if (result) {
            delivered = std::move(result);
        }
    }

    return delivered;
}

std::optional<ChunkResult> ChunkDispatcher::wait(std::chrono::milliseconds timeout) {
    for (InFlight& flight : inFlight_) {
        if (flight.id == activeTask_) {
            flight.future.wait_for(timeout);
            break;
        }
    }
    return poll();
}

std::optional<ChunkResult> ChunkDispatcher::collect(InFlight& flight) {
    const bool active = flight.id == activeTask_;

    try {
        taskpool::TaskResult result = flight.future.get();
        if (!active) {
            ++stats_.discarded;
            return std::nullopt;
        }

        activeTask_ = taskpool::kNoTask;
        ++stats_.delivered;
        return std::any_cast<ChunkResult>(std::move(result.value));
    } catch (const taskpool::TaskError& e) {
        if (e.code() == taskpool::TaskErrorCode::Cancelled || !active) {
            ++stats_.discarded;
            return std::nullopt;
        }

        ++stats_.failed;
        activeTask_ = taskpool::kNoTask;
        std::cerr << "ChunkDispatcher: chunk task " << flight.id << " failed: " << e.what() << std::endl;

        ChunkResult failed;
        failed.success = false;
        failed.error = e.what();
        return failed;
    } catch (const std::bad_any_cast& e) {
        ++stats_.failed;
        activeTask_ = taskpool::kNoTask;
        std::cerr << "ChunkDispatcher: chunk task " << flight.id << " returned an unexpected value." << std::endl;

        ChunkResult failed;
        failed.success = false;
        failed.error = e.what();
        return failed;
    }
}
