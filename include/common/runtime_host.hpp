#pragma once

#include <vector>
#include <deque>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <chrono>
#include "common/backup_status.hpp"

class TaskHandle {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    bool isFinished() const { return finished_.load(std::memory_order_acquire); }

private:
    friend class RuntimeHost;
    void markFinished() { finished_.store(true, std::memory_order_release); }

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
};

struct RuntimeStats {
    size_t totalTasks{0};
    size_t completedTasks{0};
    size_t failedTasks{0};
    size_t cancelledTasks{0};
    size_t currentQueueSize{0};
    size_t activeTasks{0};
    size_t completionsDelivered{0};
};

enum class TaskPriority {
    LOW,
    NORMAL,
    HIGH
};

// Multi-threaded executor shared by every backup job of the process.
//
// Work runs on the worker pool. Caller visible callbacks go through
// postCompletion() and run on a single completion thread, so they are
// never invoked from the thread that issued the call. The completion
// thread lives as long as the host object; shutdown() only stops the
// workers.
class RuntimeHost {
public:
    // Throws BridgeError(InitializationError) if the threads cannot be created.
    explicit RuntimeHost(size_t numThreads = 0);
    ~RuntimeHost();

    RuntimeHost(const RuntimeHost&) = delete;
    RuntimeHost& operator=(const RuntimeHost&) = delete;

    // Process wide instance. start() creates it once and returns the
    // existing host afterwards; after shutdownProcessRuntime() it throws
    // BridgeError(RuntimeClosed).
    static std::shared_ptr<RuntimeHost> start(size_t numThreads = 0);
    static std::shared_ptr<RuntimeHost> instance();
    static bool shutdownProcessRuntime(std::chrono::milliseconds grace);

    // onCancel runs instead of work when the task is dropped (cancelled
    // handle or shutdown). Throws BridgeError(RuntimeClosed) after shutdown.
    std::shared_ptr<TaskHandle> submit(std::function<void()> work,
                                       std::function<void()> onCancel = nullptr,
                                       TaskPriority priority = TaskPriority::NORMAL);

    // Same as submit(), but still accepted while shutdown() waits out its
    // grace period, so a running task can queue the next step of a chain.
    // Throws BridgeError(RuntimeClosed) once the workers are stopping.
    std::shared_ptr<TaskHandle> submitContinuation(std::function<void()> work,
                                                   std::function<void()> onCancel = nullptr,
                                                   TaskPriority priority = TaskPriority::NORMAL);

    template<typename F>
    auto submitWithResult(F&& f, TaskPriority priority = TaskPriority::NORMAL)
        -> std::future<typename std::result_of<F()>::type>;

    void postCompletion(std::function<void()> callback);

    // Returns true when all work drained within the grace period.
    bool shutdown(std::chrono::milliseconds grace);

    bool isClosed() const;
    // Raised once shutdown gives up waiting; long running tasks poll it.
    bool isShuttingDown() const { return cancelRunning_.load(std::memory_order_relaxed); }
    // True on worker and completion threads of any host.
    static bool isRuntimeThread();

    void waitForAll();
    size_t getThreadCount() const { return workers_.size(); }
    RuntimeStats getStats() const;

private:
    struct Task {
        std::function<void()> func;
        std::function<void()> onCancel;
        TaskPriority priority;
        uint64_t sequence;
        std::shared_ptr<TaskHandle> handle;
    };

    struct TaskOrder {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    std::shared_ptr<TaskHandle> enqueue(std::function<void()> work, std::function<void()> onCancel,
                                        TaskPriority priority, bool continuation);
    void workerThread();
    void completionThread();
    void runCancel(Task& task);

    std::vector<std::thread> workers_;
    std::priority_queue<Task, std::vector<Task>, TaskOrder> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    bool stop_{false};
    bool closed_{false};
    uint64_t nextSequence_{0};
    size_t activeTasks_{0};
    std::atomic<bool> cancelRunning_{false};

    std::thread completionWorker_;
    std::deque<std::function<void()>> completions_;
    std::mutex completionMutex_;
    std::condition_variable completionCondition_;
    bool completionStop_{false};

    mutable std::mutex statsMutex_;
    RuntimeStats stats_;
};

template<typename F>
auto RuntimeHost::submitWithResult(F&& f, TaskPriority priority)
    -> std::future<typename std::result_of<F()>::type> {
    using return_type = typename std::result_of<F()>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    // Dropping the packaged_task without running it leaves a broken_promise
    // in the future, which is what a cancelled task reports.
    submit([task]() { (*task)(); },
           [task]() { task->reset(); },
           priority);
    return result;
}
