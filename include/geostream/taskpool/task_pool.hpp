#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "geostream/taskpool/bounded_channel.hpp"

namespace taskpool {

class TaskPool;

using TaskId = std::uint64_t;
using Bytes = std::vector<std::uint8_t>;

inline constexpr TaskId kNoTask = 0;

enum class TaskKind : std::uint8_t {
    Parse = 0,
    Decimate,
    TransformChunk,
    Cancel,
    ClearCache,
};

const char* to_string(TaskKind kind) noexcept;

struct TaskPayload {
    std::shared_ptr<const Bytes> bytes;
    std::any options;
};

struct Task {
    TaskId id = kNoTask;
    TaskKind kind = TaskKind::Parse;
    TaskPayload payload;
    bool transfer_ownership = false;
};

struct TaskResult {
    TaskId id = kNoTask;
    std::any value;
    double processing_time_ms = 0.0;
};

enum class TaskErrorCode : std::uint8_t {
    Cancelled = 0,
    Disposed,
    Failed,
    ResourceExhausted,
    WorkerUnavailable,
};

const char* to_string(TaskErrorCode code) noexcept;

class TaskError : public std::runtime_error {
public:
    TaskError(TaskErrorCode code, TaskId id, const std::string& message)
        : std::runtime_error(message), code_(code), id_(id) {}

    [[nodiscard]] TaskErrorCode code() const noexcept { return code_; }
    [[nodiscard]] TaskId task_id() const noexcept { return id_; }

private:
    TaskErrorCode code_;
    TaskId id_;
};

// Thrown by a handler that observed a cancel request and stopped early.
class TaskCancelled : public std::exception {
public:
    const char* what() const noexcept override { return "task cancelled"; }
};

struct ProgressUpdate {
    TaskId id = kNoTask;
    float progress = 0.0f;
};

using ProgressCallback = std::function<void(const ProgressUpdate&)>;

struct SubmitOptions {
    // When false the payload bytes are deep-copied at submit time.
    bool transfer_ownership = false;
    ProgressCallback on_progress;
};

struct SubmittedTask {
    TaskId id = kNoTask;
    std::future<TaskResult> result;
};

struct PoolMetrics {
    std::uint64_t tasks_processed = 0;
    double avg_processing_time_ms = 0.0;
    std::size_t peak_queue_length = 0;
    std::size_t queue_length = 0;
    std::size_t active_workers = 0;
    std::size_t total_workers = 0;
};

class WorkerContext {
public:
    [[nodiscard]] TaskId task_id() const noexcept { return task_id_; }
    [[nodiscard]] std::size_t worker_index() const noexcept { return worker_index_; }

    void report_progress(float progress);
    [[nodiscard]] bool cancel_requested() const noexcept;

private:
    friend class TaskPool;

    WorkerContext(TaskPool& pool, std::size_t worker_index, TaskId task_id,
                  const std::atomic<TaskId>& cancel_target)
        : pool_(pool), worker_index_(worker_index), task_id_(task_id), cancel_target_(cancel_target) {}

    TaskPool& pool_;
    std::size_t worker_index_;
    TaskId task_id_;
    const std::atomic<TaskId>& cancel_target_;
};

// Worker-side processing contract. Every worker owns one handler instance,
// so per-handler state such as caches is never shared between threads.
class TaskHandler {
public:
    virtual ~TaskHandler() = default;

    virtual std::any handle(const Task& task, WorkerContext& ctx) = 0;
    virtual void clear_cache() {}
};

using HandlerFactory = std::function<std::unique_ptr<TaskHandler>(std::size_t worker_index)>;

class TaskPool {
public:
    struct Config {
        // 0 selects hardware_concurrency - 1, clamped to at least one.
        std::size_t max_workers = 0;
        bool terminate_on_dispose = true;
        std::size_t progress_capacity = 256;
    };

    explicit TaskPool(HandlerFactory factory);
    TaskPool(HandlerFactory factory, Config config);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    SubmittedTask submit(TaskKind kind, TaskPayload payload, SubmitOptions options = {});
    bool cancel(TaskId id);
    void clear_cache();
    void dispose();

    [[nodiscard]] PoolMetrics metrics() const;
    [[nodiscard]] bool available() const;
    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

    static std::size_t default_worker_count();

private:
    friend class WorkerContext;

    enum class EventType : std::uint8_t {
        Result,
        Error,
        Cancelled,
        CacheCleared,
        RuntimeFault,
    };

    struct WorkerEvent {
        EventType type = EventType::Result;
        std::size_t worker_index = 0;
        TaskId task_id = kNoTask;
        std::any value;
        TaskErrorCode error_code = TaskErrorCode::Failed;
        std::string message;
        double processing_time_ms = 0.0;
    };

    struct InboxMessage {
        bool clear_cache = false;
        Task task;
    };

    struct Worker {
        std::size_t index = 0;
        std::unique_ptr<TaskHandler> handler;
        std::thread thread;

        std::mutex inbox_mutex;
        std::condition_variable inbox_cv;
        std::deque<InboxMessage> inbox;
        bool stop_requested = false;

        std::atomic<TaskId> cancel_target{kNoTask};

        // Guarded by control_mutex_.
        bool busy = false;
        TaskId assigned_task = kNoTask;
    };

    struct PendingTask {
        std::promise<TaskResult> promise;
        ProgressCallback on_progress;
    };

    class MPSCEventQueue;

    void worker_loop(Worker& worker);
    void run_task(Worker& worker, Task&& task);
    void control_loop();

    void post(Worker& worker, InboxMessage&& message);
    void publish_event(WorkerEvent&& event);
    void publish_progress(const ProgressUpdate& update);
    void wake_control();

    void handle_event(WorkerEvent&& event);
    void deliver_progress();
    void process_queue_locked();
    void shutdown_threads();

    Config config_;
    HandlerFactory factory_;

    std::atomic<bool> disposed_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<TaskId> next_task_id_{1};

    mutable std::mutex control_mutex_;
    std::deque<Task> queue_;
    std::unordered_map<TaskId, PendingTask> pending_;
    std::uint64_t tasks_processed_ = 0;
    double total_processing_time_ms_ = 0.0;
    std::size_t peak_queue_length_ = 0;

    std::unique_ptr<MPSCEventQueue> events_;
    BoundedChannel<ProgressUpdate> progress_;
    std::mutex control_wait_mutex_;
    std::condition_variable control_cv_;

    std::vector<std::unique_ptr<Worker>> workers_;
    std::thread control_thread_;
    std::once_flag shutdown_once_;
};

}  // namespace taskpool
