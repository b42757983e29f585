#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>
#include "backup/backup_transport.hpp"
#include "common/bridge_config.hpp"
#include "common/backup_status.hpp"
#include "common/runtime_host.hpp"

// Upload side of one backup job.
//
// Wraps a BackupTransport with the job's retry policy:
//  - ConnectionError: reconnect (same session) and repeat the call, at
//    most reconnectAttempts times per call; the budget running out
//    surfaces ConnectionError.
//  - UploadError: repeat the call up to the call's transient budget;
//    exhaustion surfaces the call's escalation code.
//  - anything else is passed through unchanged.
// Concurrent chunk uploads are bounded by maxInFlightUploads. When a host
// is given, retrying stops with RuntimeClosed once its shutdown grace
// period has expired.
class UploadClient {
public:
    enum class UploadOutcome {
        Uploaded,
        AlreadyPresent
    };

    UploadClient(std::shared_ptr<BackupTransport> transport, const BridgeConfig& config,
                 std::shared_ptr<RuntimeHost> host = nullptr);
    ~UploadClient();

    // Returns true when the server has a previous backup of this group.
    bool connect(const ServerParams& params);
    bool isConnected() const;
    void disconnect();

    bool hasChunk(const Digest& digest);
    // Idempotent: a digest acknowledged before is not sent again.
    UploadOutcome uploadChunk(const Digest& digest, const std::vector<uint8_t>& payload,
                              uint64_t rawSize, bool encrypted);

    std::string createIndex(const std::string& archive, IndexKind kind, uint64_t size, uint64_t chunkSize);
    void registerIndexEntries(const std::string& writerId, const std::vector<IndexEntry>& entries);
    void finalizeImage(const std::string& writerId, uint64_t chunkCount, uint64_t size, const Digest& checksum);
    std::vector<Digest> knownChunks(const std::string& archive);
    void uploadBlob(const std::string& name, const std::vector<uint8_t>& data);
    void finalizeJob();
    // Best effort notification of the server; failures are logged.
    void abortJob(const std::string& reason);

    // Stops retry loops and wakes threads waiting for an upload slot.
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }

    size_t getInFlight() const;
    size_t getPeakInFlight() const;
    uint64_t getReconnectCount() const { return reconnects_.load(); }

private:
    class SlotGuard {
    public:
        explicit SlotGuard(UploadClient& client) : client_(client) { client_.acquireSlot(); }
        ~SlotGuard() { client_.releaseSlot(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;
    private:
        UploadClient& client_;
    };

    template<typename F>
    auto withRetry(const std::string& what, int transientBudget, ErrorCode exhaustedCode, F&& fn)
        -> decltype(fn());

    void recover(uint64_t observedGeneration);
    void backoff(int attempt);
    void checkCancelled() const;
    void acquireSlot();
    void releaseSlot();
    bool isAcked(const Digest& digest) const;
    bool isStopping() const;
    void markAcked(const Digest& digest);

    std::shared_ptr<BackupTransport> transport_;
    BridgeConfig config_;
    std::shared_ptr<RuntimeHost> host_;

    mutable std::mutex ackMutex_;
    std::unordered_set<Digest, DigestHash> acked_;

    std::mutex reconnectMutex_;
    std::atomic<uint64_t> generation_{0};
    std::atomic<uint64_t> reconnects_{0};

    mutable std::mutex slotMutex_;
    std::condition_variable slotCondition_;
    size_t inFlight_{0};
    size_t peakInFlight_{0};

    std::atomic<bool> cancelled_{false};
};
