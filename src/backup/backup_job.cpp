#include "backup/backup_job.hpp"
#include "common/crypt_config.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace {

// Token of the operation running on this thread, 0 outside runOperation().
thread_local uint64_t currentOperation = 0;

class OperationScope {
public:
    explicit OperationScope(uint64_t token) : previous_(currentOperation) { currentOperation = token; }
    ~OperationScope() { currentOperation = previous_; }
private:
    uint64_t previous_;
};

} // namespace

BackupJob::ActivityGuard::ActivityGuard(BackupJob& job) : job_(job) {
    std::lock_guard<std::mutex> lock(job_.activityMutex_);
    ++job_.activeTasks_;
}

BackupJob::ActivityGuard::~ActivityGuard() {
    {
        std::lock_guard<std::mutex> lock(job_.activityMutex_);
        --job_.activeTasks_;
    }
    job_.activityCondition_.notify_all();
}

BackupJob::BackupJob(const BackupOptions& options,
                     const BridgeConfig& config,
                     std::shared_ptr<BackupTransport> transport,
                     std::shared_ptr<RuntimeHost> host)
    : options_(options)
    , config_(config)
    , chunkSize_(options.chunkSize != 0 ? options.chunkSize : config.defaultChunkSize)
    , crypt_(options.crypt)
    , host_(std::move(host))
    , client_(std::make_shared<UploadClient>(std::move(transport), config, host_)) {
    options_.validate();
    if (!host_) {
        throw BridgeError(ErrorCode::InvalidArgument, "Backup job needs a runtime host");
    }
    setId(generateId());
    Logger::info("Created backup job " + getId() + " for vm/" + options_.backupId +
                 " (chunk size " + std::to_string(chunkSize_) + (crypt_ ? ", encrypted)" : ")"));
}

BackupJob::~BackupJob() {
    client_->cancel();
    cache_.release();
}

OperationResult BackupJob::execute(const std::string& what, const std::function<uint64_t()>& body) {
    ActivityGuard guard(*this);
    try {
        return OperationResult::success(body());
    } catch (const BridgeError& e) {
        return handleFailure(e.code(), e.what());
    } catch (const std::exception& e) {
        return handleFailure(ErrorCode::JobError, what + " failed: " + e.what());
    }
}

OperationResult BackupJob::handleFailure(ErrorCode code, const std::string& message) {
    if (isAborted()) {
        // keep the error that aborted the job
        Logger::debug("Job " + getId() + ": " + message);
        return OperationResult::failure(code, message);
    }

    Logger::error("Job " + getId() + ": " + message);
    setError(message);
    if (isFatalError(code)) {
        abortWith(message, message);
    }
    return OperationResult::failure(code, message);
}

void BackupJob::requireConnected() const {
    if (!connected_.load()) {
        throw BridgeError(ErrorCode::InvalidJobState, "Backup job " + getId() + " is not connected");
    }
}

void BackupJob::requireState(State expected, const std::string& what) const {
    State state = getState();
    if (state != expected) {
        throw BridgeError(ErrorCode::InvalidJobState,
                          what + " is not allowed in state " + jobStatusToString(state));
    }
}

void BackupJob::requireWritable(const std::string& what) {
    if (getState() == State::Created) {
        transitionTo(State::Active);
    }
    requireState(State::Active, what);
}

std::shared_ptr<ImageStream> BackupJob::findImage(uint8_t deviceId) const {
    std::lock_guard<std::mutex> lock(imagesMutex_);
    auto it = images_.find(deviceId);
    if (it == images_.end()) {
        throw BridgeError(ErrorCode::InvalidArgument, "Unknown device id " + std::to_string(deviceId));
    }
    return it->second;
}

std::shared_ptr<Strand> BackupJob::getImageStrand(uint8_t deviceId) const {
    std::lock_guard<std::mutex> lock(imagesMutex_);
    auto it = images_.find(deviceId);
    return it == images_.end() ? nullptr : it->second->getStrand();
}

OperationResult BackupJob::connect() {
    return execute("Connect", [this]() -> uint64_t {
        requireState(State::Created, "Connect");
        if (connected_.load()) {
            throw BridgeError(ErrorCode::InvalidJobState, "Backup job " + getId() + " is already connected");
        }

        ServerParams params;
        params.repository = options_.repository;
        params.password = options_.password;
        params.fingerprint = options_.fingerprint;
        params.verifyTls = options_.verifyTls && config_.verifyTls;
        params.backupId = options_.backupId;
        params.backupTime = options_.backupTime;

        const bool previous = client_->connect(params);
        previousBackup_.store(previous);
        if (!options_.knownChunks.empty()) {
            cache_.seed(options_.knownChunks);
        }
        connected_.store(true);
        return previous ? 1 : 0;
    });
}

OperationResult BackupJob::registerImage(const std::string& name, uint64_t size, IndexKind kind, bool incremental) {
    return execute("Register image " + name, [&]() -> uint64_t {
        std::lock_guard<std::mutex> registerLock(registerMutex_);
        requireConnected();
        requireWritable("Registering image " + name);

        if (name.empty()) {
            throw BridgeError(ErrorCode::InvalidArgument, "Image name must not be empty");
        }
        if (size == 0) {
            throw BridgeError(ErrorCode::InvalidArgument, "Image " + name + " has size 0");
        }
        {
            std::lock_guard<std::mutex> lock(imagesMutex_);
            if (nextDeviceId_ > 255) {
                throw BridgeError(ErrorCode::InvalidArgument, "Too many images in backup job " + getId());
            }
            for (const auto& entry : images_) {
                if (entry.second->getName() == name) {
                    throw BridgeError(ErrorCode::InvalidArgument, "Image " + name + " is already registered");
                }
            }
        }

        const std::string archive = archiveName(name, kind);
        if (incremental) {
            if (kind != IndexKind::Fixed) {
                throw BridgeError(ErrorCode::InvalidArgument,
                                  "Incremental backup of image " + name + " requires a fixed index");
            }
            if (!previousBackup_.load()) {
                throw BridgeError(ErrorCode::InvalidArgument,
                                  "Incremental backup of image " + name + " without a previous backup");
            }
            std::vector<Digest> known = client_->knownChunks(archive);
            Logger::info("Seeding chunk cache with " + std::to_string(known.size()) +
                         " chunks of previous " + archive);
            cache_.seed(known);
        }

        const std::string writerId = client_->createIndex(archive, kind, size, chunkSize_);
        std::shared_ptr<Strand> strand;
        if (kind == IndexKind::Dynamic) {
            strand = std::make_shared<Strand>(host_);
        }

        std::lock_guard<std::mutex> lock(imagesMutex_);
        const uint8_t deviceId = static_cast<uint8_t>(nextDeviceId_++);
        images_[deviceId] = std::make_shared<ImageStream>(deviceId, name, size, kind, chunkSize_, writerId,
                                                          config_.indexBatchSize, strand, incremental);
        Logger::info("Registered image " + archive + " (" + std::to_string(size) + " bytes) as device " +
                     std::to_string(deviceId));
        return deviceId;
    });
}

OperationResult BackupJob::addConfig(const std::string& name, const std::vector<uint8_t>& data) {
    return execute("Add config " + name, [&]() -> uint64_t {
        requireConnected();
        State state = getState();
        if (state != State::Created && state != State::Active) {
            throw BridgeError(ErrorCode::InvalidJobState,
                              "Adding configuration is not allowed in state " + jobStatusToString(state));
        }
        if (name.empty()) {
            throw BridgeError(ErrorCode::InvalidArgument, "Configuration name must not be empty");
        }

        const std::string blobName = name + ".blob";
        {
            std::lock_guard<std::mutex> lock(imagesMutex_);
            for (const auto& existing : configBlobs_) {
                if (existing == blobName) {
                    throw BridgeError(ErrorCode::InvalidArgument, "Configuration " + name + " was already added");
                }
            }
            configBlobs_.push_back(blobName);
        }

        try {
            client_->uploadBlob(blobName, crypt_ ? crypt_->encrypt(data.data(), data.size()) : data);
        } catch (const BridgeError&) {
            std::lock_guard<std::mutex> lock(imagesMutex_);
            configBlobs_.erase(std::remove(configBlobs_.begin(), configBlobs_.end(), blobName), configBlobs_.end());
            throw;
        }
        bytesUploaded_ += data.size();
        return 0;
    });
}

OperationResult BackupJob::writeData(uint8_t deviceId, const uint8_t* data, uint64_t offset, uint64_t size,
                                     PendingOperation* operation) {
    return execute("Write", [&]() -> uint64_t {
        {
            std::lock_guard<std::mutex> lock(activityMutex_);
            ++activeWrites_;
        }
        struct WriteCounter {
            BackupJob& job;
            ~WriteCounter() {
                {
                    std::lock_guard<std::mutex> lock(job.activityMutex_);
                    --job.activeWrites_;
                }
                job.activityCondition_.notify_all();
            }
        } counter{*this};

        requireWritable("Write");
        auto image = findImage(deviceId);
        image->beginWrite(offset, size);

        try {
            if (image->getKind() == IndexKind::Fixed) {
                storeChunk(*image, offset, data, static_cast<size_t>(size));
            } else {
                std::vector<uint8_t> zeros;
                if (!data) {
                    zeros.assign(static_cast<size_t>(size), 0);
                    data = zeros.data();
                }
                image->getChunker().push(data, static_cast<size_t>(size), [&](const uint8_t* chunk, size_t length) {
                    storeChunk(*image, image->advanceChunkOffset(length), chunk, length);
                });
            }
        } catch (const std::exception&) {
            image->endWrite(offset, false);
            throw;
        }
        image->endWrite(offset, true);

        bytesWritten_ += size;
        if (operation) {
            operation->addProgress(size);
        }
        return size;
    });
}

void BackupJob::storeChunk(ImageStream& image, uint64_t offset, const uint8_t* data, size_t size) {
    const Digest digest = data ? computeDigest(data, size) : zeroChunkDigest(size);
    ++chunksTotal_;

    if (cache_.claim(digest) == DedupCache::Claim::Known) {
        ++chunksReused_;
        bytesReused_ += size;
    } else {
        try {
            std::vector<uint8_t> zeros;
            if (!data) {
                zeros.assign(size, 0);
                data = zeros.data();
            }
            const std::vector<uint8_t> payload = encodeChunk(data, size);
            auto outcome = client_->uploadChunk(digest, payload, size, crypt_ != nullptr);
            cache_.markAcked(digest);

            if (outcome == UploadClient::UploadOutcome::Uploaded) {
                ++chunksUploaded_;
                bytesUploaded_ += payload.size();
            } else {
                ++chunksReused_;
                bytesReused_ += size;
            }
        } catch (const std::exception&) {
            cache_.markFailed(digest);
            throw;
        }
    }

    image.addEntry(IndexEntry{offset, size, digest});
    flushIndex(image, false);
}

void BackupJob::flushIndex(ImageStream& image, bool all) {
    std::lock_guard<std::mutex> lock(image.getRegistrationMutex());
    for (;;) {
        std::vector<IndexEntry> batch = image.takeBatch(all);
        if (batch.empty()) {
            return;
        }
        image.markRegistered(batch);
        client_->registerIndexEntries(image.getWriterId(), batch);
    }
}

Digest BackupJob::computeDigest(const uint8_t* data, size_t size) const {
    return crypt_ ? crypt_->computeDigest(data, size) : sha256(data, size);
}

Digest BackupJob::zeroChunkDigest(size_t size) {
    std::lock_guard<std::mutex> lock(zeroMutex_);
    auto it = zeroDigests_.find(size);
    if (it != zeroDigests_.end()) {
        return it->second;
    }
    std::vector<uint8_t> zeros(size, 0);
    Digest digest = computeDigest(zeros.data(), zeros.size());
    zeroDigests_.emplace(size, digest);
    return digest;
}

std::vector<uint8_t> BackupJob::encodeChunk(const uint8_t* data, size_t size) const {
    if (crypt_) {
        return crypt_->encrypt(data, size);
    }
    return std::vector<uint8_t>(data, data + size);
}

OperationResult BackupJob::closeImage(uint8_t deviceId) {
    return execute("Close image", [&]() -> uint64_t {
        requireState(State::Active, "Closing an image");
        auto image = findImage(deviceId);
        image->beginClose();

        if (image->getKind() == IndexKind::Dynamic) {
            image->getChunker().flush([&](const uint8_t* chunk, size_t length) {
                storeChunk(*image, image->advanceChunkOffset(length), chunk, length);
            });
        }

        // A full backup covers the whole image; blocks never written are zero.
        const std::vector<uint64_t> unwritten = image->takeUnwrittenBlocks();
        if (!unwritten.empty()) {
            Logger::info("Image " + image->getName() + ": storing " + std::to_string(unwritten.size()) +
                         " unwritten blocks as zero");
        }
        for (uint64_t offset : unwritten) {
            const uint64_t length = std::min(image->getChunkSize(), image->getSize() - offset);
            storeChunk(*image, offset, nullptr, static_cast<size_t>(length));
        }
        flushIndex(*image, true);

        const Digest checksum = image->finalizeChecksum();
        const uint64_t chunkCount = image->getChunkCount();
        const uint64_t size = image->getIndexedSize();
        client_->finalizeImage(image->getWriterId(), chunkCount, size, checksum);
        image->markClosed();

        {
            std::lock_guard<std::mutex> lock(imagesMutex_);
            manifestEntries_.push_back(ManifestEntry{image->getArchiveName(), image->getKind(), size,
                                                     chunkCount, checksum});
        }
        Logger::info("Closed image " + image->getArchiveName() + ": " + std::to_string(chunkCount) +
                     " chunks, " + std::to_string(size) + " bytes");
        return 0;
    });
}

std::vector<uint8_t> BackupJob::buildManifest() const {
    json files = json::array();
    json configs = json::array();
    {
        std::lock_guard<std::mutex> lock(imagesMutex_);
        for (const auto& entry : manifestEntries_) {
            files.push_back({
                {"filename", entry.archive},
                {"type", indexKindToString(entry.kind)},
                {"size", entry.size},
                {"chunk-count", entry.chunkCount},
                {"csum", digestToHex(entry.checksum)}
            });
        }
        for (const auto& name : configBlobs_) {
            configs.push_back(name);
        }
    }

    BackupCounters counters = getCounters();
    json manifest = {
        {"backup-type", "vm"},
        {"backup-id", options_.backupId},
        {"backup-time", options_.backupTime},
        {"files", files},
        {"configs", configs},
        {"counters", {
            {"bytes-written", counters.bytesWritten},
            {"bytes-uploaded", counters.bytesUploaded},
            {"bytes-reused", counters.bytesReused},
            {"chunks-total", counters.chunksTotal},
            {"chunks-uploaded", counters.chunksUploaded},
            {"chunks-reused", counters.chunksReused}
        }}
    };
    if (crypt_) {
        manifest["crypt-fingerprint"] = crypt_->fingerprint();
    }

    const std::string text = manifest.dump(2);
    return std::vector<uint8_t>(text.begin(), text.end());
}

OperationResult BackupJob::finish() {
    return execute("Finish", [this]() -> uint64_t {
        {
            std::lock_guard<std::mutex> registerLock(registerMutex_);
            requireState(State::Active, "Finishing");
            {
                std::lock_guard<std::mutex> lock(imagesMutex_);
                for (const auto& entry : images_) {
                    if (!entry.second->isClosed()) {
                        throw BridgeError(ErrorCode::InvalidJobState,
                                          "Image " + entry.second->getName() + " is not closed");
                    }
                }
            }
            if (!transitionTo(State::Finishing)) {
                throw BridgeError(ErrorCode::InvalidJobState, "Finishing is not allowed in state " +
                                  jobStatusToString(getState()));
            }
        }

        {
            std::unique_lock<std::mutex> lock(activityMutex_);
            activityCondition_.wait(lock, [this]() { return activeWrites_ == 0; });
        }

        client_->uploadBlob(MANIFEST_BLOB_NAME, buildManifest());
        client_->finalizeJob();

        if (!transitionTo(State::Finished)) {
            throw BridgeError(ErrorCode::Cancelled, "Backup job " + getId() + " was aborted while finishing");
        }
        cache_.release();
        client_->disconnect();

        BackupCounters counters = getCounters();
        Logger::info("Backup job " + getId() + " finished: " + std::to_string(counters.chunksTotal) +
                     " chunks, " + std::to_string(counters.chunksUploaded) + " uploaded, " +
                     std::to_string(counters.chunksReused) + " reused");
        return 0;
    });
}

bool BackupJob::abort(const std::string& reason) {
    State state = getState();
    if (state == State::Finished) {
        return false;
    }
    abortWith(reason, "Backup aborted: " + reason);
    return true;
}

void BackupJob::abortWith(const std::string& reason, const std::string& error) {
    if (!transitionTo(State::Aborted)) {
        return;
    }
    setError(error);
    Logger::warning("Aborting backup job " + getId() + ": " + reason);

    client_->cancel();
    cache_.release();

    std::vector<std::shared_ptr<PendingOperation>> pending;
    {
        std::lock_guard<std::mutex> lock(operationsMutex_);
        for (const auto& entry : operations_) {
            pending.push_back(entry.second);
        }
    }
    for (const auto& operation : pending) {
        if (operation->getToken() == currentOperation) {
            // resolved with its own error by runOperation()
            continue;
        }
        operation->requestCancel();
        operation->resolve(OperationResult::failure(ErrorCode::Cancelled, "Backup aborted: " + reason));
    }

    notifyServerAbort(reason);
}

void BackupJob::notifyServerAbort(const std::string& reason) {
    if (!connected_.load()) {
        return;
    }
    auto client = client_;
    try {
        host_->submit([client, reason]() { client->abortJob(reason); }, nullptr, TaskPriority::HIGH);
    } catch (const BridgeError& e) {
        Logger::warning("Cannot notify server about aborted backup " + getId() + ": " + e.what());
    }
}

void BackupJob::runOperation(const std::shared_ptr<PendingOperation>& operation,
                             const std::function<OperationResult()>& body) {
    if (!operation->isResolved()) {
        OperationScope scope(operation->getToken());
        operation->resolve(body());
    }
    completeOperation(operation->getToken());
}

void BackupJob::trackOperation(const std::shared_ptr<PendingOperation>& operation) {
    std::lock_guard<std::mutex> lock(operationsMutex_);
    operations_[operation->getToken()] = operation;
}

void BackupJob::completeOperation(uint64_t token) {
    std::lock_guard<std::mutex> lock(operationsMutex_);
    operations_.erase(token);
}

std::shared_ptr<PendingOperation> BackupJob::findOperation(uint64_t token) const {
    std::lock_guard<std::mutex> lock(operationsMutex_);
    auto it = operations_.find(token);
    return it == operations_.end() ? nullptr : it->second;
}

size_t BackupJob::getPendingOperationCount() const {
    std::lock_guard<std::mutex> lock(operationsMutex_);
    size_t count = 0;
    for (const auto& entry : operations_) {
        if (!entry.second->isResolved()) {
            ++count;
        }
    }
    return count;
}

void BackupJob::waitForIdle() {
    std::unique_lock<std::mutex> lock(activityMutex_);
    activityCondition_.wait(lock, [this]() { return activeTasks_ == 0; });
}

BackupCounters BackupJob::getCounters() const {
    BackupCounters counters;
    counters.bytesWritten = bytesWritten_.load();
    counters.bytesUploaded = bytesUploaded_.load();
    counters.bytesReused = bytesReused_.load();
    counters.chunksTotal = chunksTotal_.load();
    counters.chunksUploaded = chunksUploaded_.load();
    counters.chunksReused = chunksReused_.load();
    return counters;
}

BackupStatus BackupJob::getBackupStatus() const {
    BackupStatus status;
    status.status = getState();
    status.jobId = getId();
    status.createdAt = getCreatedAt();
    status.counters = getCounters();
    status.error = getLastError();
    status.inFlightOperations = getPendingOperationCount();
    status.openImages = 0;
    std::lock_guard<std::mutex> lock(imagesMutex_);
    for (const auto& entry : images_) {
        if (!entry.second->isClosed()) {
            ++status.openImages;
        }
    }
    return status;
}
