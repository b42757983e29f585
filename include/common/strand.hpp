#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include "common/runtime_host.hpp"

// Runs posted work on the runtime host one item at a time, in the order
// it was posted. Items already queued keep running while the host drains
// during shutdown; only new posts are refused.
class Strand : public std::enable_shared_from_this<Strand> {
public:
    explicit Strand(std::shared_ptr<RuntimeHost> host);

    // Throws BridgeError(RuntimeClosed) when the host no longer accepts work.
    void post(std::function<void()> work, std::function<void()> onCancel);

    size_t pending() const;

private:
    struct Item {
        std::function<void()> work;
        std::function<void()> onCancel;
    };

    void dispatch(bool continuation);
    void runNext();
    void cancelPending();

    std::shared_ptr<RuntimeHost> host_;
    std::deque<Item> queue_;
    bool running_{false};
    mutable std::mutex mutex_;
};
