#include "bridge/sync_bridge.hpp"
#include "common/logger.hpp"
#include <future>

SyncBridge::SyncBridge(std::shared_ptr<RuntimeHost> host, const BridgeConfig& config,
                       TransportFactory transportFactory)
    : host_(std::move(host))
    , config_(config)
    , jobs_(host_, config, std::move(transportFactory)) {
}

SyncBridge::~SyncBridge() {
    std::lock_guard<std::mutex> lock(tokensMutex_);
    tokens_.clear();
}

std::string SyncBridge::createJob(const BackupOptions& options) {
    return jobs_.createBackupJob(options)->getId();
}

std::shared_ptr<PendingOperation> SyncBridge::schedule(const std::string& jobId,
                                                       const std::string& description,
                                                       JobBody body,
                                                       CompletionCallback callback,
                                                       int deviceId,
                                                       std::function<void()> onFinished) {
    auto operation = std::make_shared<PendingOperation>(PendingOperation::nextToken(), description,
                                                        host_, std::move(callback));
    auto job = jobs_.getBackupJob(jobId);
    if (!job) {
        operation->resolve(OperationResult::failure(ErrorCode::InvalidArgument, "Unknown backup job " + jobId));
        if (onFinished) {
            onFinished();
        }
        return operation;
    }
    job->trackOperation(operation);

    auto run = [job, operation, body, onFinished]() {
        job->runOperation(operation, [&]() { return body(*job, *operation); });
        if (onFinished) {
            onFinished();
        }
    };
    auto cancel = [job, operation, onFinished]() {
        operation->resolve(OperationResult::failure(ErrorCode::RuntimeClosed,
                                                    operation->getDescription() + " dropped by runtime shutdown"));
        job->completeOperation(operation->getToken());
        if (onFinished) {
            onFinished();
        }
    };

    try {
        std::shared_ptr<Strand> strand;
        if (deviceId >= 0) {
            strand = job->getImageStrand(static_cast<uint8_t>(deviceId));
        }
        if (strand) {
            strand->post(run, cancel);
        } else {
            host_->submit(run, cancel);
        }
    } catch (const BridgeError& e) {
        operation->resolve(OperationResult::failure(e.code(), e.what()));
        job->completeOperation(operation->getToken());
        if (onFinished) {
            onFinished();
        }
    }
    return operation;
}

OperationResult SyncBridge::runBlocking(const std::string& jobId, const std::string& description,
                                        JobBody body, int deviceId) {
    if (RuntimeHost::isRuntimeThread()) {
        return OperationResult::failure(ErrorCode::InvalidArgument,
                                        description + ": blocking call from runtime thread");
    }

    // The caller's buffers must stay untouched until the work is done, so
    // wait for the task itself, not only for the result.
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    auto operation = schedule(jobId, description, std::move(body), nullptr, deviceId,
                              [done]() { done->set_value(); });
    finished.wait();
    return operation->wait();
}

OperationResult SyncBridge::connect(const std::string& jobId) {
    return runBlocking(jobId, "connect", [](BackupJob& job, PendingOperation&) {
        return job.connect();
    });
}

OperationResult SyncBridge::registerImage(const std::string& jobId, const std::string& name, uint64_t size,
                                          IndexKind kind, bool incremental) {
    return runBlocking(jobId, "register image " + name, [=](BackupJob& job, PendingOperation&) {
        return job.registerImage(name, size, kind, incremental);
    });
}

OperationResult SyncBridge::addConfig(const std::string& jobId, const std::string& name,
                                      const uint8_t* data, size_t size) {
    std::vector<uint8_t> blob(data, data + size);
    return runBlocking(jobId, "add config " + name, [name, blob](BackupJob& job, PendingOperation&) {
        return job.addConfig(name, blob);
    });
}

OperationResult SyncBridge::writeData(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                                      uint64_t offset, uint64_t size) {
    return runBlocking(jobId, "write", [=](BackupJob& job, PendingOperation& operation) {
        return job.writeData(deviceId, data, offset, size, &operation);
    }, deviceId);
}

OperationResult SyncBridge::closeImage(const std::string& jobId, uint8_t deviceId) {
    return runBlocking(jobId, "close image", [=](BackupJob& job, PendingOperation&) {
        return job.closeImage(deviceId);
    }, deviceId);
}

OperationResult SyncBridge::finish(const std::string& jobId) {
    return runBlocking(jobId, "finish", [](BackupJob& job, PendingOperation&) {
        return job.finish();
    });
}

bool SyncBridge::abort(const std::string& jobId, const std::string& reason) {
    auto job = jobs_.getBackupJob(jobId);
    if (!job) {
        return false;
    }
    return job->abort(reason);
}

void SyncBridge::connectAsync(const std::string& jobId, CompletionCallback callback) {
    schedule(jobId, "connect", [](BackupJob& job, PendingOperation&) {
        return job.connect();
    }, std::move(callback), -1, nullptr);
}

void SyncBridge::registerImageAsync(const std::string& jobId, const std::string& name, uint64_t size,
                                    IndexKind kind, bool incremental, CompletionCallback callback) {
    schedule(jobId, "register image " + name, [=](BackupJob& job, PendingOperation&) {
        return job.registerImage(name, size, kind, incremental);
    }, std::move(callback), -1, nullptr);
}

void SyncBridge::addConfigAsync(const std::string& jobId, const std::string& name,
                                const uint8_t* data, size_t size, CompletionCallback callback) {
    std::vector<uint8_t> blob(data, data + size);
    schedule(jobId, "add config " + name, [name, blob](BackupJob& job, PendingOperation&) {
        return job.addConfig(name, blob);
    }, std::move(callback), -1, nullptr);
}

std::shared_ptr<PendingOperation> SyncBridge::scheduleWrite(const std::string& jobId, uint8_t deviceId,
                                                            const uint8_t* data, uint64_t offset, uint64_t size,
                                                            CompletionCallback callback) {
    std::shared_ptr<std::vector<uint8_t>> buffer;
    if (data) {
        buffer = std::make_shared<std::vector<uint8_t>>(data, data + size);
    }

    return schedule(jobId, "write", [=](BackupJob& job, PendingOperation& pending) {
        return job.writeData(deviceId, buffer ? buffer->data() : nullptr, offset, size, &pending);
    }, std::move(callback), deviceId, nullptr);
}

void SyncBridge::writeDataAsync(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                                uint64_t offset, uint64_t size, CompletionCallback callback) {
    scheduleWrite(jobId, deviceId, data, offset, size, std::move(callback));
}

uint64_t SyncBridge::submitWrite(const std::string& jobId, uint8_t deviceId, const uint8_t* data,
                                 uint64_t offset, uint64_t size) {
    auto operation = scheduleWrite(jobId, deviceId, data, offset, size, nullptr);

    std::lock_guard<std::mutex> lock(tokensMutex_);
    tokens_[operation->getToken()] = TokenEntry{jobId, operation};
    return operation->getToken();
}

void SyncBridge::closeImageAsync(const std::string& jobId, uint8_t deviceId, CompletionCallback callback) {
    schedule(jobId, "close image", [=](BackupJob& job, PendingOperation&) {
        return job.closeImage(deviceId);
    }, std::move(callback), deviceId, nullptr);
}

void SyncBridge::finishAsync(const std::string& jobId, CompletionCallback callback) {
    schedule(jobId, "finish", [](BackupJob& job, PendingOperation&) {
        return job.finish();
    }, std::move(callback), -1, nullptr);
}

std::shared_ptr<PendingOperation> SyncBridge::findToken(const std::string& jobId, uint64_t token) const {
    std::lock_guard<std::mutex> lock(tokensMutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end() || it->second.jobId != jobId) {
        return nullptr;
    }
    return it->second.operation;
}

bool SyncBridge::poll(const std::string& jobId, uint64_t token, OperationResult& result) {
    auto operation = findToken(jobId, token);
    if (!operation) {
        result = OperationResult::failure(ErrorCode::InvalidArgument, "Unknown token " + std::to_string(token));
        return true;
    }
    if (!operation->tryGetResult(result)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(tokensMutex_);
    tokens_.erase(token);
    return true;
}

uint64_t SyncBridge::progress(const std::string& jobId, uint64_t token) const {
    auto operation = findToken(jobId, token);
    return operation ? operation->getProgress() : 0;
}

OperationResult SyncBridge::wait(const std::string& jobId, uint64_t token) {
    auto operation = findToken(jobId, token);
    if (!operation) {
        return OperationResult::failure(ErrorCode::InvalidArgument, "Unknown token " + std::to_string(token));
    }
    if (RuntimeHost::isRuntimeThread() && !operation->isResolved()) {
        return OperationResult::failure(ErrorCode::InvalidArgument, "wait: blocking call from runtime thread");
    }

    OperationResult result = operation->wait();
    std::lock_guard<std::mutex> lock(tokensMutex_);
    tokens_.erase(token);
    return result;
}

size_t SyncBridge::getTokenCount() const {
    std::lock_guard<std::mutex> lock(tokensMutex_);
    return tokens_.size();
}

std::string SyncBridge::lastError(const std::string& jobId) const {
    auto job = jobs_.getBackupJob(jobId);
    if (!job) {
        return "Unknown backup job " + jobId;
    }
    return job->getLastError();
}

bool SyncBridge::getStatus(const std::string& jobId, BackupStatus& status) const {
    auto job = jobs_.getBackupJob(jobId);
    if (!job) {
        return false;
    }
    status = job->getBackupStatus();
    return true;
}

bool SyncBridge::releaseJob(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(tokensMutex_);
        for (auto it = tokens_.begin(); it != tokens_.end();) {
            if (it->second.jobId == jobId) {
                it = tokens_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return jobs_.removeJob(jobId);
}
