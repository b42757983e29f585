#pragma once

#include "common/job.hpp"
#include "common/bridge_config.hpp"
#include "common/pending_operation.hpp"
#include "common/runtime_host.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_transport.hpp"
#include "backup/dedup_cache.hpp"
#include "backup/image_stream.hpp"
#include "backup/upload_client.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class CryptConfig;

// One backup run against the server.
//
// Every operation runs synchronously on the calling (runtime) thread and
// reports failures through the returned OperationResult. Fatal errors
// abort the job; after that only abort() and getLastError() are useful.
class BackupJob : public Job {
public:
    static constexpr const char* MANIFEST_BLOB_NAME = "index.json.blob";

    BackupJob(const BackupOptions& options,
              const BridgeConfig& config,
              std::shared_ptr<BackupTransport> transport,
              std::shared_ptr<RuntimeHost> host);
    ~BackupJob() override;

    // value: 1 when a previous backup of the same id exists, else 0
    OperationResult connect();
    // value: device id of the new image
    OperationResult registerImage(const std::string& name, uint64_t size, IndexKind kind, bool incremental);
    OperationResult addConfig(const std::string& name, const std::vector<uint8_t>& data);
    // value: bytes accepted. `data` may be null for an all zero block.
    OperationResult writeData(uint8_t deviceId, const uint8_t* data, uint64_t offset, uint64_t size,
                              PendingOperation* operation = nullptr);
    OperationResult closeImage(uint8_t deviceId);
    OperationResult finish();

    // Returns false only for a finished job.
    bool abort(const std::string& reason) override;

    // Serial queue that has to run writes and close of a dynamic image;
    // nullptr for fixed or unknown images.
    std::shared_ptr<Strand> getImageStrand(uint8_t deviceId) const;

    // Runs `body` for a tracked operation and resolves the operation with
    // its result. An operation cancelled before it started is skipped.
    void runOperation(const std::shared_ptr<PendingOperation>& operation,
                      const std::function<OperationResult()>& body);
    void trackOperation(const std::shared_ptr<PendingOperation>& operation);
    void completeOperation(uint64_t token);
    std::shared_ptr<PendingOperation> findOperation(uint64_t token) const;
    size_t getPendingOperationCount() const;

    // Blocks until no operation of this job is running.
    void waitForIdle();

    BackupStatus getBackupStatus() const;
    BackupCounters getCounters() const;
    uint64_t getChunkSize() const { return chunkSize_; }
    bool hasPreviousBackup() const { return previousBackup_.load(); }
    const UploadClient& getUploadClient() const { return *client_; }

private:
    struct ManifestEntry {
        std::string archive;
        IndexKind kind;
        uint64_t size;
        uint64_t chunkCount;
        Digest checksum;
    };

    class ActivityGuard {
    public:
        explicit ActivityGuard(BackupJob& job);
        ~ActivityGuard();
    private:
        BackupJob& job_;
    };

    OperationResult execute(const std::string& what, const std::function<uint64_t()>& body);
    OperationResult handleFailure(ErrorCode code, const std::string& message);
    void abortWith(const std::string& reason, const std::string& error);
    void notifyServerAbort(const std::string& reason);

    void requireConnected() const;
    void requireState(State expected, const std::string& what) const;
    // Moves a fresh job to Active; throws InvalidJobState unless Active.
    void requireWritable(const std::string& what);
    std::shared_ptr<ImageStream> findImage(uint8_t deviceId) const;

    void storeChunk(ImageStream& image, uint64_t offset, const uint8_t* data, size_t size);
    void flushIndex(ImageStream& image, bool all);
    Digest computeDigest(const uint8_t* data, size_t size) const;
    Digest zeroChunkDigest(size_t size);
    std::vector<uint8_t> encodeChunk(const uint8_t* data, size_t size) const;
    std::vector<uint8_t> buildManifest() const;

    BackupOptions options_;
    BridgeConfig config_;
    uint64_t chunkSize_;
    std::shared_ptr<CryptConfig> crypt_;
    std::shared_ptr<RuntimeHost> host_;
    std::shared_ptr<UploadClient> client_;
    DedupCache cache_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> previousBackup_{false};

    // serializes image registration against finish
    std::mutex registerMutex_;
    mutable std::mutex imagesMutex_;
    std::map<uint8_t, std::shared_ptr<ImageStream>> images_;
    std::vector<ManifestEntry> manifestEntries_;
    std::vector<std::string> configBlobs_;
    unsigned nextDeviceId_{0};

    std::mutex zeroMutex_;
    std::map<uint64_t, Digest> zeroDigests_;

    mutable std::mutex operationsMutex_;
    std::map<uint64_t, std::shared_ptr<PendingOperation>> operations_;

    std::mutex activityMutex_;
    std::condition_variable activityCondition_;
    size_t activeTasks_{0};
    size_t activeWrites_{0};

    std::atomic<uint64_t> bytesWritten_{0};
    std::atomic<uint64_t> bytesUploaded_{0};
    std::atomic<uint64_t> bytesReused_{0};
    std::atomic<uint64_t> chunksTotal_{0};
    std::atomic<uint64_t> chunksUploaded_{0};
    std::atomic<uint64_t> chunksReused_{0};
};
