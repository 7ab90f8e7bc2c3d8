#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "geostream/taskpool/task_pool.hpp"

using namespace taskpool;
using namespace std::chrono_literals;

namespace {
struct ConcurrencyTracker {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
};

// Sleeps briefly while tracking how many handlers run at once.
class SleepHandler : public TaskHandler {
public:
    explicit SleepHandler(std::shared_ptr<ConcurrencyTracker> tracker) : tracker_(std::move(tracker)) {}

    std::any handle(const Task& task, WorkerContext&) override {
        const int now = ++tracker_->active;
        int seen = tracker_->peak.load();
        while (now > seen && !tracker_->peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(20ms);
        --tracker_->active;
        return static_cast<int>(task.id);
    }

private:
    std::shared_ptr<ConcurrencyTracker> tracker_;
};

// Blocks until the gate opens or the task is cancelled.
class GateHandler : public TaskHandler {
public:
    explicit GateHandler(std::shared_future<void> gate) : gate_(std::move(gate)) {}

    std::any handle(const Task&, WorkerContext& ctx) override {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (gate_.wait_for(1ms) != std::future_status::ready) {
            if (ctx.cancel_requested()) {
                throw TaskCancelled();
            }
            if (std::chrono::steady_clock::now() > deadline) {
                throw std::runtime_error("gate never opened");
            }
        }
        return std::string("done");
    }

private:
    std::shared_future<void> gate_;
};

// Behaviour chosen by the std::string carried in the task options.
class ScriptedHandler : public TaskHandler {
public:
    explicit ScriptedHandler(std::shared_ptr<std::atomic<int>> clears = nullptr) : clears_(std::move(clears)) {}

    std::any handle(const Task& task, WorkerContext& ctx) override {
        const auto* script = std::any_cast<std::string>(&task.payload.options);
        const std::string command = script ? *script : "";
        if (command == "fail") {
            throw std::runtime_error("scripted failure");
        }
        if (command == "oom") {
            throw std::bad_alloc();
        }
        if (command == "progress") {
            ctx.report_progress(0.25f);
            ctx.report_progress(0.75f);
            return std::string("progressed");
        }
        if (command == "address") {
            return task.payload.bytes ? task.payload.bytes->data() : static_cast<const uint8_t*>(nullptr);
        }
        return std::string("ok");
    }

    void clear_cache() override {
        if (clears_) {
            ++*clears_;
        }
    }

private:
    std::shared_ptr<std::atomic<int>> clears_;
};

HandlerFactory scriptedFactory(std::shared_ptr<std::atomic<int>> clears = nullptr) {
    return [clears](std::size_t) { return std::make_unique<ScriptedHandler>(clears); };
}

TaskPayload scripted(const std::string& command) {
    TaskPayload payload;
    payload.options = command;
    return payload;
}

TaskErrorCode errorCodeOf(std::future<TaskResult>& future) {
    try {
        future.get();
    } catch (const TaskError& e) {
        return e.code();
    }
    ADD_FAILURE() << "future resolved without a TaskError";
    return TaskErrorCode::Failed;
}
}  // namespace

TEST(TaskPool, TwoWorkersRunAtMostTwoTasksAtOnce) {
    auto tracker = std::make_shared<ConcurrencyTracker>();
    TaskPool pool([tracker](std::size_t) { return std::make_unique<SleepHandler>(tracker); }, TaskPool::Config{2});

    std::vector<SubmittedTask> tasks;
    for (int i = 0; i < 10; ++i) {
        tasks.push_back(pool.submit(TaskKind::Parse, TaskPayload{}));
    }

    for (SubmittedTask& task : tasks) {
        TaskResult result = task.result.get();
        EXPECT_EQ(std::any_cast<int>(result.value), static_cast<int>(task.id));
        EXPECT_EQ(result.id, task.id);
    }

    EXPECT_EQ(tracker->peak.load(), 2);

    const PoolMetrics metrics = pool.metrics();
    EXPECT_EQ(metrics.tasks_processed, 10u);
    EXPECT_EQ(metrics.total_workers, 2u);
    EXPECT_EQ(metrics.queue_length, 0u);
    EXPECT_GE(metrics.peak_queue_length, 1u);
    EXPECT_GT(metrics.avg_processing_time_ms, 0.0);
}

TEST(TaskPool, TaskIdsAreUniqueAndIncreasing) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});

    TaskId previous = kNoTask;
    std::vector<SubmittedTask> tasks;
    for (int i = 0; i < 5; ++i) {
        tasks.push_back(pool.submit(TaskKind::Parse, scripted("ok")));
        EXPECT_GT(tasks.back().id, previous);
        previous = tasks.back().id;
    }
    for (SubmittedTask& task : tasks) {
        task.result.get();
    }
}

TEST(TaskPool, CancellingQueuedTaskRejectsWithCancelled) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    TaskPool pool([opened](std::size_t) { return std::make_unique<GateHandler>(opened); }, TaskPool::Config{1});

    SubmittedTask running = pool.submit(TaskKind::Parse, TaskPayload{});
    SubmittedTask queued = pool.submit(TaskKind::Parse, TaskPayload{});

    EXPECT_TRUE(pool.cancel(queued.id));
    EXPECT_EQ(errorCodeOf(queued.result), TaskErrorCode::Cancelled);

    gate.set_value();
    EXPECT_EQ(std::any_cast<std::string>(running.result.get().value), "done");
    EXPECT_EQ(pool.metrics().tasks_processed, 1u);
}

TEST(TaskPool, CancellingInFlightTaskIsAdvisory) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    TaskPool pool([opened](std::size_t) { return std::make_unique<GateHandler>(opened); }, TaskPool::Config{1});

    SubmittedTask running = pool.submit(TaskKind::Parse, TaskPayload{});
    while (pool.metrics().active_workers == 0) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_FALSE(pool.cancel(running.id));
    EXPECT_EQ(errorCodeOf(running.result), TaskErrorCode::Cancelled);
    gate.set_value();
}

TEST(TaskPool, CancelsOfTwoRunningTasksBothLand) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    TaskPool pool([opened](std::size_t) { return std::make_unique<GateHandler>(opened); }, TaskPool::Config{2});

    SubmittedTask first = pool.submit(TaskKind::Parse, TaskPayload{});
    SubmittedTask second = pool.submit(TaskKind::Parse, TaskPayload{});
    while (pool.metrics().active_workers < 2) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_FALSE(pool.cancel(first.id));
    EXPECT_FALSE(pool.cancel(second.id));
    EXPECT_EQ(errorCodeOf(first.result), TaskErrorCode::Cancelled);
    EXPECT_EQ(errorCodeOf(second.result), TaskErrorCode::Cancelled);
    gate.set_value();
}

TEST(TaskPool, CancelLeavesOtherRunningTaskAlone) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    TaskPool pool([opened](std::size_t) { return std::make_unique<GateHandler>(opened); }, TaskPool::Config{2});

    SubmittedTask cancelled = pool.submit(TaskKind::Parse, TaskPayload{});
    SubmittedTask kept = pool.submit(TaskKind::Parse, TaskPayload{});
    while (pool.metrics().active_workers < 2) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_FALSE(pool.cancel(cancelled.id));
    EXPECT_EQ(errorCodeOf(cancelled.result), TaskErrorCode::Cancelled);
    gate.set_value();
    EXPECT_EQ(std::any_cast<std::string>(kept.result.get().value), "done");
}

TEST(TaskPool, CancelOfUnknownTaskIsNoop) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});
    EXPECT_FALSE(pool.cancel(12345));

    SubmittedTask task = pool.submit(TaskKind::Parse, scripted("ok"));
    EXPECT_EQ(std::any_cast<std::string>(task.result.get().value), "ok");
}

TEST(TaskPool, HandlerErrorRejectsAndWorkerStaysUsable) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});

    SubmittedTask failing = pool.submit(TaskKind::Parse, scripted("fail"));
    SubmittedTask oom = pool.submit(TaskKind::Parse, scripted("oom"));
    SubmittedTask healthy = pool.submit(TaskKind::Parse, scripted("ok"));

    EXPECT_EQ(errorCodeOf(failing.result), TaskErrorCode::Failed);
    EXPECT_EQ(errorCodeOf(oom.result), TaskErrorCode::ResourceExhausted);
    EXPECT_EQ(std::any_cast<std::string>(healthy.result.get().value), "ok");
    EXPECT_EQ(pool.metrics().tasks_processed, 3u);
}

TEST(TaskPool, ProgressReachesCallbackBeforeResult) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});

    std::mutex mutex;
    std::vector<float> seen;
    SubmitOptions options;
    options.on_progress = [&](const ProgressUpdate& update) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(update.progress);
    };

    SubmittedTask task = pool.submit(TaskKind::Parse, scripted("progress"), options);
    task.result.get();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FLOAT_EQ(seen[0], 0.25f);
    EXPECT_FLOAT_EQ(seen[1], 0.75f);
}

TEST(TaskPool, PayloadIsCopiedUnlessOwnershipTransfers) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});
    auto bytes = std::make_shared<const Bytes>(Bytes{1, 2, 3, 4});

    TaskPayload copied = scripted("address");
    copied.bytes = bytes;
    SubmittedTask copyTask = pool.submit(TaskKind::Parse, copied);

    TaskPayload moved = scripted("address");
    moved.bytes = bytes;
    SubmitOptions transfer;
    transfer.transfer_ownership = true;
    SubmittedTask moveTask = pool.submit(TaskKind::Parse, moved, transfer);

    EXPECT_NE(std::any_cast<const uint8_t*>(copyTask.result.get().value), bytes->data());
    EXPECT_EQ(std::any_cast<const uint8_t*>(moveTask.result.get().value), bytes->data());
}

TEST(TaskPool, ClearCacheReachesEveryWorker) {
    auto clears = std::make_shared<std::atomic<int>>(0);
    TaskPool pool(scriptedFactory(clears), TaskPool::Config{3});

    pool.clear_cache();

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (clears->load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(clears->load(), 3);
}

TEST(TaskPool, DisposeRejectsPendingTasks) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    TaskPool pool([opened](std::size_t) { return std::make_unique<GateHandler>(opened); }, TaskPool::Config{1});

    SubmittedTask running = pool.submit(TaskKind::Parse, TaskPayload{});
    SubmittedTask queued = pool.submit(TaskKind::Parse, TaskPayload{});

    pool.dispose();

    EXPECT_EQ(errorCodeOf(running.result), TaskErrorCode::Disposed);
    EXPECT_EQ(errorCodeOf(queued.result), TaskErrorCode::Disposed);
    EXPECT_FALSE(pool.available());
    EXPECT_THROW(pool.submit(TaskKind::Parse, TaskPayload{}), std::runtime_error);

    pool.dispose();
}

TEST(TaskPool, FailingWorkersAreDropped) {
    auto attempts = std::make_shared<std::atomic<int>>(0);
    TaskPool pool(
        [attempts](std::size_t) -> std::unique_ptr<TaskHandler> {
            if (attempts->fetch_add(1) == 0) {
                throw std::runtime_error("first handler refused");
            }
            return std::make_unique<ScriptedHandler>();
        },
        TaskPool::Config{3});

    EXPECT_EQ(pool.worker_count(), 2u);
    EXPECT_TRUE(pool.available());

    SubmittedTask task = pool.submit(TaskKind::Parse, scripted("ok"));
    EXPECT_EQ(std::any_cast<std::string>(task.result.get().value), "ok");
}

TEST(TaskPool, PoolWithoutWorkersRejectsAsUnavailable) {
    TaskPool pool([](std::size_t) -> std::unique_ptr<TaskHandler> { return nullptr; }, TaskPool::Config{2});

    EXPECT_EQ(pool.worker_count(), 0u);
    EXPECT_FALSE(pool.available());

    SubmittedTask task = pool.submit(TaskKind::Parse, TaskPayload{});
    EXPECT_EQ(errorCodeOf(task.result), TaskErrorCode::WorkerUnavailable);
}

TEST(TaskPool, ControlKindsCannotBeSubmitted) {
    TaskPool pool(scriptedFactory(), TaskPool::Config{1});
    EXPECT_THROW(pool.submit(TaskKind::Cancel, TaskPayload{}), std::invalid_argument);
    EXPECT_THROW(pool.submit(TaskKind::ClearCache, TaskPayload{}), std::invalid_argument);
}

TEST(BoundedChannel, FullChannelDropsOldest) {
    BoundedChannel<int> channel(3);
    for (int i = 0; i < 5; ++i) {
        channel.push(i);
    }

    EXPECT_EQ(channel.dropped(), 2u);
    EXPECT_EQ(channel.capacity(), 3u);
    const std::vector<int> values = channel.drain();
    EXPECT_EQ(values, (std::vector<int>{2, 3, 4}));
    EXPECT_TRUE(channel.empty());
}
