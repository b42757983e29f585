#include "common/strand.hpp"
#include "common/logger.hpp"

Strand::Strand(std::shared_ptr<RuntimeHost> host)
    : host_(std::move(host)) {
}

void Strand::post(std::function<void()> work, std::function<void()> onCancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (host_->isClosed()) {
        throw BridgeError(ErrorCode::RuntimeClosed, "Cannot post work to a closed runtime");
    }

    queue_.push_back(Item{std::move(work), std::move(onCancel)});
    if (running_) {
        return;
    }
    running_ = true;
    lock.unlock();

    dispatch(false);
}

size_t Strand::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Strand::dispatch(bool continuation) {
    auto self = shared_from_this();
    try {
        if (continuation) {
            host_->submitContinuation([self]() { self->runNext(); },
                                      [self]() { self->cancelPending(); });
        } else {
            host_->submit([self]() { self->runNext(); },
                          [self]() { self->cancelPending(); });
        }
    } catch (const BridgeError& e) {
        Logger::warning(std::string("Strand dispatch failed: ") + e.what());
        cancelPending();
    }
}

void Strand::runNext() {
    Item item;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            running_ = false;
            return;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
    }

    try {
        item.work();
    } catch (const std::exception& e) {
        Logger::error(std::string("Strand work item failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            running_ = false;
            return;
        }
    }
    dispatch(true);
}

void Strand::cancelPending() {
    std::deque<Item> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items.swap(queue_);
        running_ = false;
    }

    for (auto& item : items) {
        if (item.onCancel) {
            item.onCancel();
        }
    }
}
