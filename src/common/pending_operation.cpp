#include "common/pending_operation.hpp"
#include "common/runtime_host.hpp"
#include "common/logger.hpp"

PendingOperation::PendingOperation(uint64_t token,
                                   std::string description,
                                   std::weak_ptr<RuntimeHost> host,
                                   CompletionCallback callback)
    : token_(token)
    , description_(std::move(description))
    , host_(std::move(host))
    , callback_(std::move(callback)) {
}

uint64_t PendingOperation::nextToken() {
    static std::atomic<uint64_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

bool PendingOperation::resolve(const OperationResult& result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolved_) {
            return false;
        }
        resolved_ = true;
        result_ = result;
    }
    resolvedCondition_.notify_all();

    if (!result.ok()) {
        Logger::debug("Operation " + std::to_string(token_) + " (" + description_ + ") failed: " +
                      errorCodeToString(result.code) + ": " + result.message);
    }

    if (callback_) {
        auto host = host_.lock();
        if (!host) {
            Logger::error("Dropping completion callback for operation " + std::to_string(token_) +
                          ": runtime host is gone");
            return true;
        }
        CompletionCallback callback = std::move(callback_);
        callback_ = nullptr;
        host->postCompletion([callback, result]() { callback(result); });
    }
    return true;
}

bool PendingOperation::isResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolved_;
}

OperationResult PendingOperation::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    resolvedCondition_.wait(lock, [this] { return resolved_; });
    return result_;
}

bool PendingOperation::waitFor(std::chrono::milliseconds timeout, OperationResult& result) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!resolvedCondition_.wait_for(lock, timeout, [this] { return resolved_; })) {
        return false;
    }
    result = result_;
    return true;
}

bool PendingOperation::tryGetResult(OperationResult& result) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!resolved_) {
        return false;
    }
    result = result_;
    return true;
}
