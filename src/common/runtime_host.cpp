#include "common/runtime_host.hpp"
#include "common/logger.hpp"
#include <system_error>

namespace {

thread_local bool tlsRuntimeThread = false;

std::mutex processMutex;
std::shared_ptr<RuntimeHost> processHost;
bool processHostClosed = false;

} // namespace

RuntimeHost::RuntimeHost(size_t numThreads) {
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
    }
    if (numThreads == 0) {
        numThreads = 4;
    }

    try {
        completionWorker_ = std::thread(&RuntimeHost::completionThread, this);
        workers_.reserve(numThreads);
        for (size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back(&RuntimeHost::workerThread, this);
        }
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            stop_ = true;
            closed_ = true;
        }
        condition_.notify_all();
        for (auto& thread : workers_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        {
            std::lock_guard<std::mutex> lock(completionMutex_);
            completionStop_ = true;
        }
        completionCondition_.notify_all();
        if (completionWorker_.joinable()) {
            completionWorker_.join();
        }
        throw BridgeError(ErrorCode::InitializationError,
                          std::string("Failed to create runtime threads: ") + e.what());
    }

    Logger::debug("Runtime host started with " + std::to_string(numThreads) + " worker threads");
}

RuntimeHost::~RuntimeHost() {
    shutdown(std::chrono::milliseconds(0));

    {
        std::lock_guard<std::mutex> lock(completionMutex_);
        completionStop_ = true;
    }
    completionCondition_.notify_all();
    if (completionWorker_.joinable()) {
        completionWorker_.join();
    }
}

std::shared_ptr<RuntimeHost> RuntimeHost::start(size_t numThreads) {
    std::lock_guard<std::mutex> lock(processMutex);
    if (processHostClosed) {
        throw BridgeError(ErrorCode::RuntimeClosed, "Process runtime has been shut down");
    }
    if (!processHost) {
        processHost = std::make_shared<RuntimeHost>(numThreads);
        Logger::info("Process runtime initialized with " +
                     std::to_string(processHost->getThreadCount()) + " threads");
    }
    return processHost;
}

std::shared_ptr<RuntimeHost> RuntimeHost::instance() {
    std::lock_guard<std::mutex> lock(processMutex);
    return processHost;
}

bool RuntimeHost::shutdownProcessRuntime(std::chrono::milliseconds grace) {
    std::shared_ptr<RuntimeHost> host;
    {
        std::lock_guard<std::mutex> lock(processMutex);
        if (processHostClosed) {
            return true;
        }
        processHostClosed = true;
        host = processHost;
    }
    if (!host) {
        return true;
    }
    Logger::info("Shutting down process runtime");
    return host->shutdown(grace);
}

std::shared_ptr<TaskHandle> RuntimeHost::submit(std::function<void()> work,
                                                std::function<void()> onCancel,
                                                TaskPriority priority) {
    return enqueue(std::move(work), std::move(onCancel), priority, false);
}

std::shared_ptr<TaskHandle> RuntimeHost::submitContinuation(std::function<void()> work,
                                                            std::function<void()> onCancel,
                                                            TaskPriority priority) {
    return enqueue(std::move(work), std::move(onCancel), priority, true);
}

std::shared_ptr<TaskHandle> RuntimeHost::enqueue(std::function<void()> work,
                                                 std::function<void()> onCancel,
                                                 TaskPriority priority,
                                                 bool continuation) {
    auto handle = std::make_shared<TaskHandle>();
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (stop_ || (closed_ && !continuation)) {
            throw BridgeError(ErrorCode::RuntimeClosed, "Cannot submit work to a closed runtime");
        }

        tasks_.push(Task{std::move(work), std::move(onCancel), priority, nextSequence_++, handle});
    }
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalTasks++;
        stats_.currentQueueSize++;
    }

    condition_.notify_one();
    return handle;
}

void RuntimeHost::postCompletion(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(completionMutex_);
        completions_.push_back(std::move(callback));
    }
    completionCondition_.notify_one();
}

bool RuntimeHost::shutdown(std::chrono::milliseconds grace) {
    std::vector<Task> stragglers;
    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (closed_ && stop_) {
            return true;
        }
        closed_ = true;

        drained = idle_.wait_for(lock, grace, [this] {
            return tasks_.empty() && activeTasks_ == 0;
        });

        while (!tasks_.empty()) {
            stragglers.push_back(std::move(const_cast<Task&>(tasks_.top())));
            tasks_.pop();
        }
        stop_ = true;
    }

    if (!drained) {
        Logger::warning("Runtime shutdown grace period expired, cancelling " +
                        std::to_string(stragglers.size()) + " queued tasks");
        cancelRunning_.store(true, std::memory_order_relaxed);
    }
    condition_.notify_all();

    for (auto& task : stragglers) {
        runCancel(task);
    }

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    Logger::debug("Runtime host workers stopped");
    return drained;
}

bool RuntimeHost::isClosed() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return closed_;
}

bool RuntimeHost::isRuntimeThread() {
    return tlsRuntimeThread;
}

void RuntimeHost::waitForAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_ == 0;
    });
}

RuntimeStats RuntimeHost::getStats() const {
    RuntimeStats stats;
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats = stats_;
    }
    std::lock_guard<std::mutex> lock(queueMutex_);
    stats.activeTasks = activeTasks_;
    return stats;
}

void RuntimeHost::runCancel(Task& task) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.cancelledTasks++;
        if (stats_.currentQueueSize > 0) {
            stats_.currentQueueSize--;
        }
    }
    if (task.onCancel) {
        try {
            task.onCancel();
        } catch (const std::exception& e) {
            Logger::error(std::string("Task cancellation hook failed: ") + e.what());
        }
    }
    task.handle->markFinished();
}

void RuntimeHost::workerThread() {
    tlsRuntimeThread = true;

    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            if (tasks_.empty()) {
                return;
            }

            task = std::move(const_cast<Task&>(tasks_.top()));
            tasks_.pop();
            ++activeTasks_;
        }

        if (task.handle->isCancelled()) {
            runCancel(task);
        } else {
            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                if (stats_.currentQueueSize > 0) {
                    stats_.currentQueueSize--;
                }
            }

            bool success = true;
            try {
                if (task.func) {
                    task.func();
                }
            } catch (const std::exception& e) {
                success = false;
                Logger::error(std::string("Runtime task failed: ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                if (success) {
                    stats_.completedTasks++;
                } else {
                    stats_.failedTasks++;
                }
            }
            task.handle->markFinished();
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (tasks_.empty() && activeTasks_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

void RuntimeHost::completionThread() {
    tlsRuntimeThread = true;

    for (;;) {
        std::function<void()> callback;
        {
            std::unique_lock<std::mutex> lock(completionMutex_);
            completionCondition_.wait(lock, [this] {
                return !completions_.empty() || completionStop_;
            });
            if (completions_.empty()) {
                return;
            }
            callback = std::move(completions_.front());
            completions_.pop_front();
        }

        try {
            callback();
        } catch (const std::exception& e) {
            Logger::error(std::string("Completion callback threw: ") + e.what());
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.completionsDelivered++;
    }
}
