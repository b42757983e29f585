#include "backup/upload_client.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

UploadClient::UploadClient(std::shared_ptr<BackupTransport> transport, const BridgeConfig& config,
                           std::shared_ptr<RuntimeHost> host)
    : transport_(std::move(transport))
    , config_(config)
    , host_(std::move(host)) {
    if (!transport_) {
        throw BridgeError(ErrorCode::InvalidArgument, "Upload client needs a transport");
    }
}

UploadClient::~UploadClient() {
    cancel();
}

template<typename F>
auto UploadClient::withRetry(const std::string& what, int transientBudget, ErrorCode exhaustedCode, F&& fn)
    -> decltype(fn()) {
    int transientFailures = 0;
    int reconnectAttempts = 0;

    for (;;) {
        checkCancelled();
        const uint64_t generation = generation_.load();

        ErrorCode failure = ErrorCode::None;
        std::string message;
        try {
            return fn();
        } catch (const BridgeError& e) {
            failure = e.code();
            message = e.what();
        }

        if (failure == ErrorCode::ConnectionError) {
            // Reconnect until it works or the budget is gone, then repeat the call.
            for (;;) {
                if (reconnectAttempts >= config_.reconnectAttempts) {
                    throw BridgeError(ErrorCode::ConnectionError,
                                      what + ": giving up after " + std::to_string(reconnectAttempts) +
                                      " reconnection attempts: " + message);
                }
                ++reconnectAttempts;
                backoff(reconnectAttempts);
                try {
                    recover(generation);
                    break;
                } catch (const BridgeError& e) {
                    if (e.code() != ErrorCode::ConnectionError) {
                        throw;
                    }
                    message = e.what();
                    Logger::warning(what + ": reconnection attempt " + std::to_string(reconnectAttempts) +
                                    " failed: " + message);
                }
            }
            continue;
        }

        if (failure == ErrorCode::UploadError) {
            if (transientFailures >= transientBudget) {
                throw BridgeError(exhaustedCode,
                                  what + " failed after " + std::to_string(transientFailures + 1) +
                                  " attempts: " + message);
            }
            ++transientFailures;
            Logger::warning(what + " failed (attempt " + std::to_string(transientFailures) +
                            "), retrying: " + message);
            backoff(transientFailures);
            continue;
        }

        throw BridgeError(failure, message);
    }
}

void UploadClient::recover(uint64_t observedGeneration) {
    std::lock_guard<std::mutex> lock(reconnectMutex_);
    if (generation_.load() != observedGeneration) {
        // another thread re-established the session meanwhile
        return;
    }
    checkCancelled();

    Logger::warning("Connection to backup server lost, reconnecting");
    transport_->reconnect();
    generation_.fetch_add(1);
    reconnects_.fetch_add(1);
    Logger::info("Reconnected to backup server");
}

void UploadClient::backoff(int attempt) {
    if (config_.retryDelayMs <= 0) {
        return;
    }
    const auto deadline = std::chrono::steady_clock::now() + config_.retryDelay() * std::min(attempt, 10);
    const auto slice = std::chrono::milliseconds(20);

    std::unique_lock<std::mutex> lock(slotMutex_);
    while (!cancelled_.load() && !isStopping()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        slotCondition_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now, slice));
    }
}

bool UploadClient::isStopping() const {
    return host_ && host_->isShuttingDown();
}

void UploadClient::checkCancelled() const {
    if (cancelled_.load()) {
        throw BridgeError(ErrorCode::Cancelled, "Upload cancelled");
    }
    if (isStopping()) {
        throw BridgeError(ErrorCode::RuntimeClosed, "Runtime is shutting down");
    }
}

bool UploadClient::connect(const ServerParams& params) {
    int attempt = 0;
    for (;;) {
        checkCancelled();
        try {
            const bool hasPrevious = transport_->connect(params);
            Logger::info("Connected to " + params.repository.toString() + " for backup vm/" +
                         params.backupId + (hasPrevious ? " (previous backup found)" : ""));
            return hasPrevious;
        } catch (const BridgeError& e) {
            if (e.code() != ErrorCode::ConnectionError || attempt >= config_.reconnectAttempts) {
                throw;
            }
            ++attempt;
            Logger::warning("Connecting to " + params.repository.host + " failed (attempt " +
                            std::to_string(attempt) + "): " + e.what());
            backoff(attempt);
        }
    }
}

bool UploadClient::isConnected() const {
    return transport_->isConnected();
}

void UploadClient::disconnect() {
    transport_->disconnect();
}

bool UploadClient::hasChunk(const Digest& digest) {
    if (isAcked(digest)) {
        return true;
    }
    return withRetry("Probing chunk " + digestToHex(digest), config_.chunkProbeRetries, ErrorCode::UploadError,
                     [&]() { return transport_->hasChunk(digest); });
}

UploadClient::UploadOutcome UploadClient::uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                                                      uint64_t rawSize, bool encrypted) {
    if (isAcked(digest)) {
        return UploadOutcome::AlreadyPresent;
    }

    SlotGuard slot(*this);

    if (config_.probeBeforeUpload && hasChunk(digest)) {
        markAcked(digest);
        return UploadOutcome::AlreadyPresent;
    }

    withRetry("Uploading chunk " + digestToHex(digest), config_.uploadRetries, ErrorCode::UploadError,
              [&]() { transport_->uploadChunk(digest, payload, rawSize, encrypted); });
    markAcked(digest);
    return UploadOutcome::Uploaded;
}

std::string UploadClient::createIndex(const std::string& archive, IndexKind kind, uint64_t size, uint64_t chunkSize) {
    return withRetry("Creating index " + archive, config_.uploadRetries, ErrorCode::IndexError,
                     [&]() { return transport_->createIndex(archive, kind, size, chunkSize); });
}

void UploadClient::registerIndexEntries(const std::string& writerId, const std::vector<IndexEntry>& entries) {
    if (entries.empty()) {
        return;
    }
    withRetry("Appending " + std::to_string(entries.size()) + " entries to index " + writerId,
              config_.uploadRetries, ErrorCode::IndexError,
              [&]() { transport_->appendIndex(writerId, entries); });
}

void UploadClient::finalizeImage(const std::string& writerId, uint64_t chunkCount, uint64_t size,
                                 const Digest& checksum) {
    withRetry("Closing index " + writerId, config_.uploadRetries, ErrorCode::IndexError,
              [&]() { transport_->closeIndex(writerId, chunkCount, size, checksum); });
}

std::vector<Digest> UploadClient::knownChunks(const std::string& archive) {
    return withRetry("Downloading previous index " + archive, config_.chunkProbeRetries, ErrorCode::UploadError,
                     [&]() { return transport_->knownChunks(archive); });
}

void UploadClient::uploadBlob(const std::string& name, const std::vector<uint8_t>& data) {
    withRetry("Uploading blob " + name, config_.uploadRetries, ErrorCode::UploadError,
              [&]() { transport_->uploadBlob(name, data); });
}

void UploadClient::finalizeJob() {
    withRetry("Finishing backup", config_.uploadRetries, ErrorCode::JobError,
              [&]() { transport_->finish(); });
}

void UploadClient::abortJob(const std::string& reason) {
    try {
        transport_->abort(reason);
    } catch (const BridgeError& e) {
        Logger::warning(std::string("Failed to notify server about aborted backup: ") + e.what());
    }
}

void UploadClient::cancel() {
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        cancelled_.store(true);
    }
    slotCondition_.notify_all();
}

void UploadClient::acquireSlot() {
    std::unique_lock<std::mutex> lock(slotMutex_);
    slotCondition_.wait(lock, [this]() {
        return cancelled_.load() || inFlight_ < config_.maxInFlightUploads;
    });
    if (cancelled_.load()) {
        throw BridgeError(ErrorCode::Cancelled, "Upload cancelled");
    }
    ++inFlight_;
    peakInFlight_ = std::max(peakInFlight_, inFlight_);
}

void UploadClient::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(slotMutex_);
        --inFlight_;
    }
    slotCondition_.notify_all();
}

size_t UploadClient::getInFlight() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return inFlight_;
}

size_t UploadClient::getPeakInFlight() const {
    std::lock_guard<std::mutex> lock(slotMutex_);
    return peakInFlight_;
}

bool UploadClient::isAcked(const Digest& digest) const {
    std::lock_guard<std::mutex> lock(ackMutex_);
    return acked_.count(digest) != 0;
}

void UploadClient::markAcked(const Digest& digest) {
    std::lock_guard<std::mutex> lock(ackMutex_);
    acked_.insert(digest);
}
