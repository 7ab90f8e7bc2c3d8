#include "geostream/taskpool/task_pool.hpp"

#include <algorithm>
#include <iostream>
#include <new>
#include <optional>
#include <utility>

namespace taskpool {

const char* to_string(TaskKind kind) noexcept {
    switch (kind) {
        case TaskKind::Parse:
            return "parse";
        case TaskKind::Decimate:
            return "decimate";
        case TaskKind::TransformChunk:
            return "transform-chunk";
        case TaskKind::Cancel:
            return "cancel";
        case TaskKind::ClearCache:
            return "clear-cache";
    }
    return "unknown";
}

const char* to_string(TaskErrorCode code) noexcept {
    switch (code) {
        case TaskErrorCode::Cancelled:
            return "cancelled";
        case TaskErrorCode::Disposed:
            return "disposed";
        case TaskErrorCode::Failed:
            return "failed";
        case TaskErrorCode::ResourceExhausted:
            return "resource-exhausted";
        case TaskErrorCode::WorkerUnavailable:
            return "worker-unavailable";
    }
    return "unknown";
}

void WorkerContext::report_progress(float progress) {
    pool_.publish_progress(ProgressUpdate{task_id_, std::clamp(progress, 0.0f, 1.0f)});
}

bool WorkerContext::cancel_requested() const noexcept {
    return cancel_target_.load(std::memory_order_acquire) == task_id_;
}

class TaskPool::MPSCEventQueue {
public:
    MPSCEventQueue() {
        Node* stub = new Node();
        head_.store(stub, std::memory_order_relaxed);
        tail_ = stub;
    }

    ~MPSCEventQueue() {
        while (pop().has_value()) {
        }
        delete tail_;
    }

    void push(WorkerEvent&& event) {
        Node* node = new Node(std::move(event));
        Node* prev = head_.exchange(node, std::memory_order_acq_rel);
        prev->next.store(node, std::memory_order_release);
    }

    // Consumer side only.
    std::optional<WorkerEvent> pop() {
        Node* tail = tail_;
        Node* next = tail->next.load(std::memory_order_acquire);
        if (next == nullptr) {
            return std::nullopt;
        }

        tail_ = next;
        std::optional<WorkerEvent> event = std::move(next->event);
        next->event.reset();
        delete tail;
        return event;
    }

    bool empty() const {
        return tail_->next.load(std::memory_order_acquire) == nullptr;
    }

private:
    struct Node {
        std::atomic<Node*> next{nullptr};
        std::optional<WorkerEvent> event;

        Node() = default;
        explicit Node(WorkerEvent&& e) : event(std::move(e)) {}
    };

    std::atomic<Node*> head_{nullptr};
    Node* tail_{nullptr};
};

std::size_t TaskPool::default_worker_count() {
    const std::size_t n = std::thread::hardware_concurrency();
    return n <= 1 ? 1 : n - 1;
}

TaskPool::TaskPool(HandlerFactory factory) : TaskPool(std::move(factory), Config{}) {}

TaskPool::TaskPool(HandlerFactory factory, Config config)
    : config_(config),
      factory_(std::move(factory)),
      events_(std::make_unique<MPSCEventQueue>()),
      progress_(config.progress_capacity) {
    if (config_.max_workers == 0) {
        config_.max_workers = default_worker_count();
    }

    control_thread_ = std::thread([this] { control_loop(); });

    workers_.reserve(config_.max_workers);
    for (std::size_t i = 0; i < config_.max_workers; ++i) {
        auto worker = std::make_unique<Worker>();
        worker->index = workers_.size();

        try {
            if (!factory_) {
                throw std::invalid_argument("no handler factory supplied");
            }
            worker->handler = factory_(worker->index);
            if (!worker->handler) {
                throw std::runtime_error("handler factory returned null");
            }
            Worker& ref = *worker;
            worker->thread = std::thread([this, &ref] { worker_loop(ref); });
        } catch (const std::exception& e) {
            std::cerr << "TaskPool: worker " << i << " failed to start: " << e.what() << std::endl;
            continue;
        }

        workers_.push_back(std::move(worker));
    }

    if (workers_.empty()) {
        std::cerr << "TaskPool: no usable workers, submitted tasks will be rejected." << std::endl;
    } else if (workers_.size() < config_.max_workers) {
        std::cerr << "TaskPool: running degraded with " << workers_.size() << " of "
                  << config_.max_workers << " workers." << std::endl;
    }
}

TaskPool::~TaskPool() {
    dispose();
    shutdown_threads();
}

SubmittedTask TaskPool::submit(TaskKind kind, TaskPayload payload, SubmitOptions options) {
    if (kind == TaskKind::Cancel || kind == TaskKind::ClearCache) {
        throw std::invalid_argument("control messages are not submitted as tasks");
    }
    if (disposed_.load(std::memory_order_acquire)) {
        throw std::runtime_error("Cannot submit tasks after TaskPool::dispose()");
    }

    if (!options.transfer_ownership && payload.bytes) {
        payload.bytes = std::make_shared<const Bytes>(*payload.bytes);
    }

    const TaskId id = next_task_id_.fetch_add(1, std::memory_order_relaxed);
    std::promise<TaskResult> promise;
    SubmittedTask submitted{id, promise.get_future()};

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (disposed_.load(std::memory_order_acquire)) {
        promise.set_exception(std::make_exception_ptr(
            TaskError(TaskErrorCode::Disposed, id, "task pool disposed")));
        return submitted;
    }
    if (workers_.empty()) {
        promise.set_exception(std::make_exception_ptr(
            TaskError(TaskErrorCode::WorkerUnavailable, id, "task pool has no usable workers")));
        return submitted;
    }

    pending_.emplace(id, PendingTask{std::move(promise), std::move(options.on_progress)});
    queue_.push_back(Task{id, kind, std::move(payload), options.transfer_ownership});
    peak_queue_length_ = std::max(peak_queue_length_, queue_.size());
    process_queue_locked();

    return submitted;
}

bool TaskPool::cancel(TaskId id) {
    std::promise<TaskResult> promise;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        auto queued = std::find_if(queue_.begin(), queue_.end(), [id](const Task& task) {
            return task.id == id;
        });

        if (queued == queue_.end()) {
            // In flight or unknown: advisory, only the worker running `id` sees it.
            for (auto& worker : workers_) {
                if (worker->busy && worker->assigned_task == id) {
                    worker->cancel_target.store(id, std::memory_order_release);
                }
            }
            return false;
        }

        queue_.erase(queued);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return true;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }

    promise.set_exception(std::make_exception_ptr(
        TaskError(TaskErrorCode::Cancelled, id, "task " + std::to_string(id) + " cancelled")));
    return true;
}

void TaskPool::clear_cache() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (disposed_.load(std::memory_order_acquire)) {
        return;
    }
    for (auto& worker : workers_) {
        post(*worker, InboxMessage{true, Task{}});
    }
}

void TaskPool::dispose() {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::vector<std::pair<TaskId, std::promise<TaskResult>>> orphaned;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        queue_.clear();
        orphaned.reserve(pending_.size());
        for (auto& [id, pending] : pending_) {
            orphaned.emplace_back(id, std::move(pending.promise));
        }
        pending_.clear();

        for (auto& worker : workers_) {
            if (worker->busy) {
                worker->cancel_target.store(worker->assigned_task, std::memory_order_release);
            }
        }
    }

    for (auto& [id, promise] : orphaned) {
        promise.set_exception(std::make_exception_ptr(
            TaskError(TaskErrorCode::Disposed, id, "task pool disposed")));
    }

    if (config_.terminate_on_dispose) {
        shutdown_threads();
    }
}

PoolMetrics TaskPool::metrics() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    PoolMetrics metrics;
    metrics.tasks_processed = tasks_processed_;
    metrics.avg_processing_time_ms =
        tasks_processed_ == 0 ? 0.0 : total_processing_time_ms_ / static_cast<double>(tasks_processed_);
    metrics.peak_queue_length = peak_queue_length_;
    metrics.queue_length = queue_.size();
    metrics.total_workers = workers_.size();
    metrics.active_workers = static_cast<std::size_t>(
        std::count_if(workers_.begin(), workers_.end(), [](const auto& worker) { return worker->busy; }));
    return metrics;
}

bool TaskPool::available() const {
    return !workers_.empty() && !disposed_.load(std::memory_order_acquire);
}

void TaskPool::post(Worker& worker, InboxMessage&& message) {
    {
        std::lock_guard<std::mutex> lock(worker.inbox_mutex);
        worker.inbox.push_back(std::move(message));
    }
    worker.inbox_cv.notify_one();
}

void TaskPool::process_queue_locked() {
    if (disposed_.load(std::memory_order_acquire)) {
        return;
    }

    for (auto& worker : workers_) {
        if (queue_.empty()) {
            return;
        }
        if (worker->busy) {
            continue;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        worker->busy = true;
        worker->assigned_task = task.id;
        post(*worker, InboxMessage{false, std::move(task)});
    }
}

void TaskPool::worker_loop(Worker& worker) {
    while (true) {
        InboxMessage message;
        {
            std::unique_lock<std::mutex> lock(worker.inbox_mutex);
            worker.inbox_cv.wait(lock, [&worker] {
                return worker.stop_requested || !worker.inbox.empty();
            });

            if (worker.stop_requested) {
                return;
            }

            message = std::move(worker.inbox.front());
            worker.inbox.pop_front();
        }

        if (message.clear_cache) {
            try {
                worker.handler->clear_cache();
            } catch (const std::exception& e) {
                std::cerr << "TaskPool: worker " << worker.index << " failed to clear cache: " << e.what()
                          << std::endl;
            }
            WorkerEvent event;
            event.type = EventType::CacheCleared;
            event.worker_index = worker.index;
            publish_event(std::move(event));
            continue;
        }

        run_task(worker, std::move(message.task));
    }
}

void TaskPool::run_task(Worker& worker, Task&& task) {
    WorkerEvent event;
    event.worker_index = worker.index;
    event.task_id = task.id;

    WorkerContext ctx(*this, worker.index, task.id, worker.cancel_target);
    const auto start = std::chrono::steady_clock::now();

    try {
        event.value = worker.handler->handle(task, ctx);
        event.type = ctx.cancel_requested() ? EventType::Cancelled : EventType::Result;
    } catch (const TaskCancelled&) {
        event.type = EventType::Cancelled;
    } catch (const std::bad_alloc& e) {
        event.type = EventType::Error;
        event.error_code = TaskErrorCode::ResourceExhausted;
        event.message = std::string("out of memory: ") + e.what();
    } catch (const std::exception& e) {
        event.type = EventType::Error;
        event.error_code = TaskErrorCode::Failed;
        event.message = e.what();
    } catch (...) {
        event.type = EventType::RuntimeFault;
        event.message = "non-standard exception escaped the task handler";
    }

    if (event.type == EventType::Cancelled) {
        event.value.reset();
    }

    event.processing_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    publish_event(std::move(event));
}

void TaskPool::publish_event(WorkerEvent&& event) {
    events_->push(std::move(event));
    wake_control();
}

void TaskPool::publish_progress(const ProgressUpdate& update) {
    progress_.push(update);
    wake_control();
}

void TaskPool::wake_control() {
    {
        std::lock_guard<std::mutex> lock(control_wait_mutex_);
    }
    control_cv_.notify_one();
}

void TaskPool::control_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(control_wait_mutex_);
            control_cv_.wait(lock, [this] {
                return stopping_.load(std::memory_order_acquire) || !events_->empty() || !progress_.empty();
            });
        }

        deliver_progress();

        while (std::optional<WorkerEvent> event = events_->pop()) {
            // Progress published before this event must reach its callback
            // while the task is still pending.
            deliver_progress();
            handle_event(std::move(*event));
        }

        if (stopping_.load(std::memory_order_acquire) && events_->empty()) {
            return;
        }
    }
}

void TaskPool::deliver_progress() {
    for (const ProgressUpdate& update : progress_.drain()) {
        ProgressCallback callback;
        {
            std::lock_guard<std::mutex> lock(control_mutex_);
            auto it = pending_.find(update.id);
            if (it == pending_.end() || !it->second.on_progress) {
                continue;
            }
            callback = it->second.on_progress;
        }

        try {
            callback(update);
        } catch (const std::exception& e) {
            std::cerr << "TaskPool: progress callback for task " << update.id << " threw: " << e.what()
                      << std::endl;
        }
    }
}

void TaskPool::handle_event(WorkerEvent&& event) {
    if (event.type == EventType::CacheCleared) {
        return;
    }

    std::optional<std::promise<TaskResult>> promise;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        Worker& worker = *workers_[event.worker_index];
        worker.busy = false;
        worker.assigned_task = kNoTask;

        if (event.type == EventType::RuntimeFault) {
            // The task stays pending until the pool is disposed.
            std::cerr << "TaskPool: worker " << event.worker_index << " runtime error on task " << event.task_id
                      << ": " << event.message << std::endl;
        } else {
            if (event.type != EventType::Cancelled) {
                ++tasks_processed_;
                total_processing_time_ms_ += event.processing_time_ms;
            }

            auto it = pending_.find(event.task_id);
            if (it != pending_.end()) {
                promise.emplace(std::move(it->second.promise));
                pending_.erase(it);
            }
        }

        process_queue_locked();
    }

    if (!promise.has_value()) {
        return;
    }

    switch (event.type) {
        case EventType::Result:
            promise->set_value(TaskResult{event.task_id, std::move(event.value), event.processing_time_ms});
            break;
        case EventType::Error:
            promise->set_exception(std::make_exception_ptr(
                TaskError(event.error_code, event.task_id, event.message)));
            break;
        case EventType::Cancelled:
            promise->set_exception(std::make_exception_ptr(TaskError(
                TaskErrorCode::Cancelled, event.task_id, "task " + std::to_string(event.task_id) + " cancelled")));
            break;
        case EventType::CacheCleared:
        case EventType::RuntimeFault:
            break;
    }
}

void TaskPool::shutdown_threads() {
    std::call_once(shutdown_once_, [this] {
        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->inbox_mutex);
                worker->stop_requested = true;
            }
            worker->inbox_cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        stopping_.store(true, std::memory_order_release);
        wake_control();
        if (control_thread_.joinable()) {
            control_thread_.join();
        }
    });
}

}  // namespace taskpool
