#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "common/backup_status.hpp"

class RuntimeHost;

using CompletionCallback = std::function<void(const OperationResult& result)>;

// One unit of work submitted across the synchronous boundary.
//
// resolve() stores the result exactly once; later calls are ignored and
// return false. A registered callback is delivered on the runtime's
// completion thread, never from the resolving thread's stack.
class PendingOperation {
public:
    PendingOperation(uint64_t token,
                     std::string description,
                     std::weak_ptr<RuntimeHost> host,
                     CompletionCallback callback = nullptr);

    PendingOperation(const PendingOperation&) = delete;
    PendingOperation& operator=(const PendingOperation&) = delete;

    uint64_t getToken() const { return token_; }
    const std::string& getDescription() const { return description_; }

    bool resolve(const OperationResult& result);
    bool isResolved() const;

    OperationResult wait();
    bool waitFor(std::chrono::milliseconds timeout, OperationResult& result);
    bool tryGetResult(OperationResult& result) const;

    // Partial progress for long running uploads.
    void addProgress(uint64_t bytes) { progress_.fetch_add(bytes, std::memory_order_relaxed); }
    uint64_t getProgress() const { return progress_.load(std::memory_order_relaxed); }

    void requestCancel() { cancelRequested_.store(true, std::memory_order_relaxed); }
    bool isCancelRequested() const { return cancelRequested_.load(std::memory_order_relaxed); }

    static uint64_t nextToken();

private:
    const uint64_t token_;
    const std::string description_;
    std::weak_ptr<RuntimeHost> host_;
    CompletionCallback callback_;

    mutable std::mutex mutex_;
    std::condition_variable resolvedCondition_;
    bool resolved_{false};
    OperationResult result_;

    std::atomic<uint64_t> progress_{0};
    std::atomic<bool> cancelRequested_{false};
};
